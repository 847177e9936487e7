#pragma once

#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <utility>

namespace bulk_cpp {

    namespace detail {
        struct CancellationState {
            std::atomic<bool> cancelled{false};
            std::mutex mu;
            std::list<std::function<void()>> callbacks;
        };
    }  // namespace detail

    /**
     * @brief Read side of a cancellation signal.
     *
     * A default-constructed token can never be cancelled. Every suspension
     * point of a bulk operation (lease wait, admission wait, backoff delay)
     * registers a callback that wakes it when the token fires.
     */
    class CancellationToken {
       public:
        /// @brief RAII handle for a registered callback.
        class Registration {
           public:
            Registration() = default;

            Registration(Registration&& other) noexcept
                : state_(std::move(other.state_)),
                  it_(other.it_),
                  armed_(std::exchange(other.armed_, false)) {}

            Registration& operator=(Registration&& other) noexcept {
                if (this != &other) {
                    reset();
                    state_ = std::move(other.state_);
                    it_ = other.it_;
                    armed_ = std::exchange(other.armed_, false);
                }
                return *this;
            }

            Registration(Registration const&) = delete;
            Registration& operator=(Registration const&) = delete;

            ~Registration() { reset(); }

            /// @brief Unregister the callback if it has not run yet.
            void reset() noexcept {
                if (!armed_) return;
                armed_ = false;
                auto st = state_.lock();
                if (!st) return;
                std::lock_guard<std::mutex> lk(st->mu);
                // Once cancelled the list was handed to the canceller.
                if (!st->cancelled.load(std::memory_order_acquire)) {
                    st->callbacks.erase(it_);
                }
            }

           private:
            friend class CancellationToken;

            Registration(std::weak_ptr<detail::CancellationState> st,
                         std::list<std::function<void()>>::iterator it)
                : state_(std::move(st)), it_(it), armed_(true) {}

            std::weak_ptr<detail::CancellationState> state_;
            std::list<std::function<void()>>::iterator it_{};
            bool armed_{false};
        };

        CancellationToken() = default;

        bool is_cancelled() const noexcept {
            return state_ && state_->cancelled.load(std::memory_order_acquire);
        }

        bool can_be_cancelled() const noexcept {
            return static_cast<bool>(state_);
        }

        /// @brief Run @p fn when the token fires. Runs it immediately if the
        /// token already fired.
        [[nodiscard]] Registration on_cancel(std::function<void()> fn) const {
            if (!state_) return {};
            {
                std::unique_lock<std::mutex> lk(state_->mu);
                if (!state_->cancelled.load(std::memory_order_acquire)) {
                    auto it = state_->callbacks.insert(state_->callbacks.end(),
                                                       std::move(fn));
                    return Registration(state_, it);
                }
            }
            fn();
            return {};
        }

       private:
        friend class CancellationSource;

        explicit CancellationToken(
            std::shared_ptr<detail::CancellationState> st)
            : state_(std::move(st)) {}

        std::shared_ptr<detail::CancellationState> state_;
    };

    /// @brief Write side of a cancellation signal.
    class CancellationSource {
       public:
        CancellationSource()
            : state_(std::make_shared<detail::CancellationState>()) {}

        CancellationToken token() const { return CancellationToken(state_); }

        bool is_cancelled() const noexcept {
            return state_->cancelled.load(std::memory_order_acquire);
        }

        /// @brief Fire the signal. Idempotent.
        void cancel() {
            std::list<std::function<void()>> to_run;
            {
                std::lock_guard<std::mutex> lk(state_->mu);
                if (state_->cancelled.load(std::memory_order_acquire)) return;
                state_->cancelled.store(true, std::memory_order_release);
                to_run.swap(state_->callbacks);
            }
            // Run OUTSIDE lock, callbacks cancel timers
            for (auto& fn : to_run) {
                if (fn) fn();
            }
        }

       private:
        std::shared_ptr<detail::CancellationState> state_;
    };

}  // namespace bulk_cpp
