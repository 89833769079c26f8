//
// Created by cv2 on 12.01.2026.
//

#include "balancer.hpp"
#include <algorithm>
#include <print>

namespace comb {

// Never print a full bot token
static std::string short_token(const std::string& token) {
    return token.substr(0, 10) + "...";
}

std::string_view to_string(BalancerError e) {
    switch (e) {
        case BalancerError::EmptyCredentialPool: return "credential list is empty";
        case BalancerError::Cancelled:           return "cancelled";
    }
    return "unknown";
}

CredentialBalancer::CredentialBalancer(BalancerOptions options) : options_(options) {}

// --- Operations ---

bool CredentialBalancer::register_operation() {
    int current = ++active_operations_;
    if (current > options_.max_operations) {
        --active_operations_;
        std::println(stderr, "[Balancer] Max concurrent operations ({}) reached, rejecting new operation",
                     options_.max_operations);
        return false;
    }
    std::println("[Balancer] Operation registered: {} active", current);
    return true;
}

void CredentialBalancer::unregister_operation() {
    int current = --active_operations_;
    std::println("[Balancer] Operation unregistered: {} remaining", current);
}

int CredentialBalancer::recommended_workers(int total_credentials) const {
    int ops = std::max(1, active_operations_.load());
    return std::max(1, total_credentials / ops);
}

// --- Credentials ---

CredentialBalancer::Slot& CredentialBalancer::slot_for(const std::string& credential) {
    return slots_[credential]; // created lazily, lives as long as the balancer
}

// Returns false if the stop token fired before the deadline.
bool CredentialBalancer::sleep_until(Clock::time_point deadline, std::stop_token stop) {
    std::unique_lock lock(mutex_);
    released_cv_.wait_until(lock, stop, deadline, [] { return false; });
    return !stop.stop_requested();
}

std::expected<void, BalancerError> CredentialBalancer::wait_cooldown(
    const std::string& credential,
    std::optional<Clock::time_point> last_release,
    std::stop_token stop
) {
    if (!last_release) return {};

    auto ready_at = *last_release + options_.cooldown;
    if (Clock::now() >= ready_at) return {};

    // The slot stays claimed while we wait
    if (!sleep_until(ready_at, stop)) {
        give_back(credential, false);
        return std::unexpected(BalancerError::Cancelled);
    }
    return {};
}

std::expected<std::string, BalancerError> CredentialBalancer::acquire(
    const std::vector<std::string>& credentials,
    const std::optional<std::string>& operation_id,
    std::stop_token stop
) {
    if (credentials.empty()) {
        std::println(stderr, "[Balancer] Acquire with an empty credential list");
        return std::unexpected(BalancerError::EmptyCredentialPool);
    }

    // Contention damping. Does not track what each operation holds; it only
    // slows everyone down a little when several operations compete.
    if (operation_id) {
        int ops = std::max(1, active_operations_.load());
        if (ops > 1) {
            auto delay = options_.contention_step * (ops - 1);
            if (!sleep_until(Clock::now() + delay, stop)) return std::unexpected(BalancerError::Cancelled);
        }
    }

    ++waiting_requests_;
    const size_t n = credentials.size();

    std::unique_lock lock(mutex_);
    while (true) {
        size_t start = cursor_++ % n;

        for (size_t i = 0; i < n; ++i) {
            const std::string& credential = credentials[(start + i) % n];
            Slot& slot = slot_for(credential);
            if (slot.busy) continue;

            slot.busy = true;
            auto last_release = slot.last_release;
            lock.unlock();

            --waiting_requests_;
            ++total_requests_;

            if (auto res = wait_cooldown(credential, last_release, stop); !res)
                return std::unexpected(res.error());
            return credential;
        }

        // All busy. Sleep until someone releases, but never longer than the
        // back-off so the cursor keeps moving.
        uint64_t seen = release_seq_;
        released_cv_.wait_for(lock, stop, options_.busy_backoff, [&] { return release_seq_ != seen; });

        if (stop.stop_requested()) {
            --waiting_requests_;
            return std::unexpected(BalancerError::Cancelled);
        }
    }
}

std::expected<void, BalancerError> CredentialBalancer::acquire_specific(const std::string& credential, std::stop_token stop) {
    ++waiting_requests_;

    std::unique_lock lock(mutex_);
    bool free = released_cv_.wait(lock, stop, [&] { return !slot_for(credential).busy; });
    if (!free) {
        --waiting_requests_;
        return std::unexpected(BalancerError::Cancelled);
    }

    Slot& slot = slot_for(credential);
    slot.busy = true;
    auto last_release = slot.last_release;
    lock.unlock();

    --waiting_requests_;
    ++total_requests_;

    return wait_cooldown(credential, last_release, stop);
}

void CredentialBalancer::give_back(const std::string& credential, bool record_release) {
    {
        std::lock_guard lock(mutex_);
        Slot& slot = slot_for(credential);
        if (!slot.busy) {
            std::println(stderr, "[Balancer] Release of {} which is not held", short_token(credential));
        }
        if (record_release) slot.last_release = Clock::now();
        slot.busy = false;
        ++release_seq_;
    }
    released_cv_.notify_all();
}

void CredentialBalancer::release(const std::string& credential) {
    give_back(credential, true);
}

BalancerStats CredentialBalancer::stats() const {
    std::lock_guard lock(mutex_);
    return BalancerStats{
        total_requests_.load(),
        waiting_requests_.load(),
        slots_.size()
    };
}

void CredentialBalancer::reset_stats() {
    // waiting_requests_ tracks live waits; they still decrement it later
    total_requests_ = 0;
}

} // namespace comb
