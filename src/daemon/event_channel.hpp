//
// Created by cv2 on 16.01.2026.
//

#pragma once
#include <deque>
#include <mutex>
#include <chrono>
#include <memory>
#include <vector>
#include <optional>
#include <stop_token>
#include <condition_variable>

namespace comb {

    // Broadcast channel with a bounded buffer per subscriber.
    // emit() never blocks: when a subscriber's buffer is full its oldest event is dropped.
    // Events emitted while nobody is subscribed are lost.
    template <typename T>
    class EventChannel {
    public:
        class Subscription {
        public:
            explicit Subscription(size_t capacity) : capacity_(capacity) {}

            std::optional<T> try_next() {
                std::lock_guard lock(mutex_);
                return pop();
            }

            // Waits up to `timeout` for an event
            std::optional<T> next(std::chrono::milliseconds timeout, std::stop_token stop = {}) {
                std::unique_lock lock(mutex_);
                cv_.wait_for(lock, stop, timeout, [this] { return !buffer_.empty(); });
                return pop();
            }

            // Everything currently buffered, oldest first
            std::vector<T> drain() {
                std::lock_guard lock(mutex_);
                std::vector<T> out(std::make_move_iterator(buffer_.begin()), std::make_move_iterator(buffer_.end()));
                buffer_.clear();
                return out;
            }

            size_t dropped() const {
                std::lock_guard lock(mutex_);
                return dropped_;
            }

            size_t pending() const {
                std::lock_guard lock(mutex_);
                return buffer_.size();
            }

        private:
            friend class EventChannel;

            void push(const T& value) {
                {
                    std::lock_guard lock(mutex_);
                    if (buffer_.size() >= capacity_) {
                        buffer_.pop_front();
                        ++dropped_;
                    }
                    buffer_.push_back(value);
                }
                cv_.notify_one();
            }

            std::optional<T> pop() {
                if (buffer_.empty()) return std::nullopt;
                T value = std::move(buffer_.front());
                buffer_.pop_front();
                return value;
            }

            const size_t capacity_;
            mutable std::mutex mutex_;
            std::condition_variable_any cv_;
            std::deque<T> buffer_;
            size_t dropped_ = 0;
        };

        explicit EventChannel(size_t capacity) : capacity_(capacity > 0 ? capacity : 1) {}

        std::shared_ptr<Subscription> subscribe() {
            auto sub = std::make_shared<Subscription>(capacity_);
            std::lock_guard lock(mutex_);
            subscribers_.push_back(sub);
            return sub;
        }

        void emit(const T& value) {
            std::vector<std::shared_ptr<Subscription>> alive;
            {
                std::lock_guard lock(mutex_);
                // Subscribers that were let go are forgotten here
                std::erase_if(subscribers_, [](const auto& w) { return w.expired(); });
                for (auto& w : subscribers_) {
                    if (auto s = w.lock()) alive.push_back(std::move(s));
                }
            }
            for (auto& s : alive) s->push(value);
        }

        size_t capacity() const { return capacity_; }

    private:
        const size_t capacity_;
        std::mutex mutex_;
        std::vector<std::weak_ptr<Subscription>> subscribers_;
    };

} // namespace comb
