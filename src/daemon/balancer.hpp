//
// Created by cv2 on 12.01.2026.
//

#pragma once
#include <map>
#include <mutex>
#include <atomic>
#include <chrono>
#include <string>
#include <vector>
#include <optional>
#include <expected>
#include <stop_token>
#include <utility>
#include <functional>
#include <type_traits>
#include <condition_variable>

namespace comb {

    enum class BalancerError {
        EmptyCredentialPool,
        Cancelled
    };

    std::string_view to_string(BalancerError e);

    struct BalancerStats {
        int total_requests = 0;
        int waiting_requests = 0;
        size_t active_credentials_seen = 0;
    };

    struct BalancerOptions {
        // Minimum gap between two uses of the same credential
        std::chrono::milliseconds cooldown{200};
        // Max concurrent operations (uploads/downloads) admitted at once
        int max_operations = 5;
        // Extra wait per additional operation before acquiring
        std::chrono::milliseconds contention_step{50};
        // Upper bound on one wait for a free credential before rescanning
        std::chrono::milliseconds busy_backoff{50};
    };

    // Hands out rate-limited credentials (bot tokens) to concurrent transfers.
    //
    // - Each credential serves at most one request at a time.
    // - Scans start from a shared round-robin cursor so load spreads over the pool.
    // - A credential released less than `cooldown` ago is held until the cooldown elapses.
    // - Operations are counted to derive worker counts and cap admission.
    //
    // One instance per process, owned by main and passed to every executor.
    class CredentialBalancer {
    public:
        using Clock = std::chrono::steady_clock;

        explicit CredentialBalancer(BalancerOptions options = {});

        CredentialBalancer(const CredentialBalancer&) = delete;
        CredentialBalancer& operator=(const CredentialBalancer&) = delete;

        // --- Operations ---

        // false when the operation ceiling is reached; the caller must not proceed
        bool register_operation();
        void unregister_operation();
        int active_operations() const { return active_operations_.load(); }

        // Advisory worker count for one operation given the current load
        int recommended_workers(int total_credentials) const;

        // --- Credentials ---

        // Blocks until a credential is free (and cooled down), or the stop token fires.
        std::expected<std::string, BalancerError> acquire(
            const std::vector<std::string>& credentials,
            const std::optional<std::string>& operation_id = std::nullopt,
            std::stop_token stop = {}
        );

        // Waits for one particular credential (chunks already bound to a token).
        std::expected<void, BalancerError> acquire_specific(const std::string& credential, std::stop_token stop = {});

        // Must be called exactly once per successful acquire
        void release(const std::string& credential);

        // Acquire -> body(credential) -> release, the release runs on every exit path.
        template <typename Body>
        auto with_credential(const std::vector<std::string>& credentials,
                             const std::optional<std::string>& operation_id,
                             Body&& body,
                             std::stop_token stop = {})
            -> std::expected<std::invoke_result_t<Body, const std::string&>, BalancerError>;

        BalancerStats stats() const;
        // Zeroes the cumulative request count only
        void reset_stats();

        const BalancerOptions& options() const { return options_; }

    private:
        struct Slot {
            bool busy = false;
            std::optional<Clock::time_point> last_release;
        };

        Slot& slot_for(const std::string& credential); // mutex_ held
        bool sleep_until(Clock::time_point deadline, std::stop_token stop);
        void give_back(const std::string& credential, bool record_release);
        std::expected<void, BalancerError> wait_cooldown(const std::string& credential,
                                                          std::optional<Clock::time_point> last_release,
                                                          std::stop_token stop);

        BalancerOptions options_;

        // Guards slots_ and cursor_
        mutable std::mutex mutex_;
        std::condition_variable_any released_cv_;
        std::map<std::string, Slot> slots_;
        size_t cursor_ = 0;
        uint64_t release_seq_ = 0;

        std::atomic<int> active_operations_{0};
        std::atomic<int> total_requests_{0};
        std::atomic<int> waiting_requests_{0};
    };

    // Holds one acquired credential; releases it on destruction.
    class CredentialLease {
    public:
        CredentialLease() = default;
        CredentialLease(CredentialBalancer& balancer, std::string credential)
            : balancer_(&balancer), credential_(std::move(credential)) {}
        ~CredentialLease() { reset(); }

        CredentialLease(CredentialLease&& other) noexcept
            : balancer_(std::exchange(other.balancer_, nullptr)), credential_(std::move(other.credential_)) {}
        CredentialLease& operator=(CredentialLease&& other) noexcept {
            if (this != &other) {
                reset();
                balancer_ = std::exchange(other.balancer_, nullptr);
                credential_ = std::move(other.credential_);
            }
            return *this;
        }
        CredentialLease(const CredentialLease&) = delete;
        CredentialLease& operator=(const CredentialLease&) = delete;

        const std::string& credential() const { return credential_; }
        explicit operator bool() const { return balancer_ != nullptr; }

        void reset() {
            if (balancer_) {
                balancer_->release(credential_);
                balancer_ = nullptr;
            }
        }

    private:
        CredentialBalancer* balancer_ = nullptr;
        std::string credential_;
    };

    // Registers an operation for its lifetime. Check admitted() before doing any work.
    class OperationRegistration {
    public:
        explicit OperationRegistration(CredentialBalancer& balancer)
            : balancer_(balancer), admitted_(balancer.register_operation()) {}
        ~OperationRegistration() {
            if (admitted_) balancer_.unregister_operation();
        }

        OperationRegistration(const OperationRegistration&) = delete;
        OperationRegistration& operator=(const OperationRegistration&) = delete;

        bool admitted() const { return admitted_; }

    private:
        CredentialBalancer& balancer_;
        bool admitted_;
    };

    // --- template impl ---

    template <typename Body>
    auto CredentialBalancer::with_credential(const std::vector<std::string>& credentials,
                                             const std::optional<std::string>& operation_id,
                                             Body&& body,
                                             std::stop_token stop)
        -> std::expected<std::invoke_result_t<Body, const std::string&>, BalancerError>
    {
        auto credential = acquire(credentials, operation_id, stop);
        if (!credential) return std::unexpected(credential.error());

        CredentialLease lease(*this, std::move(*credential));
        if constexpr (std::is_void_v<std::invoke_result_t<Body, const std::string&>>) {
            std::invoke(std::forward<Body>(body), lease.credential());
            return {};
        } else {
            return std::invoke(std::forward<Body>(body), lease.credential());
        }
    }

} // namespace comb
