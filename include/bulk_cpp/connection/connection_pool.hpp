#pragma once

#include <atomic>
#include <utility>  // before Boost.Asio: boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "bulk_cpp/cancellation.hpp"
#include "bulk_cpp/config.hpp"
#include "bulk_cpp/connection/connection.hpp"
#include "bulk_cpp/connection/connection_pool_types.hpp"
#include "bulk_cpp/error.hpp"
#include "bulk_cpp/remote_session.hpp"
#include "bulk_cpp/result.hpp"

namespace bulk_cpp {

    /**
     * Thread-safe pool of authenticated connections to one environment.
     *
     * SAFETY:
     * - All public methods are thread-safe and can be called from any thread
     * - Internal state protected by mutex, no strict strand requirement
     * - Coroutines may resume on different threads
     *
     * INVARIANTS:
     * 1. idle_.size() + in_use_.size() + creating_ <= effective_capacity_,
     *    except right after a capacity shrink, when no lease is handed out
     *    and released connections are dropped until it holds again
     * 2. No connection exists in both idle_ and in_use_
     * 3. Every idle connection is Idle or Throttled, every in-use one Leased
     * 4. 1 <= effective_capacity_ <= cfg_.max_pool_size
     *
     * CAPACITY:
     * The effective capacity is the service's recommended parallelism
     * clamped to [1, max_pool_size]. It starts at 1, is queried through the
     * first lease handed out and then every capacity_refresh_interval. A
     * failed query is retried after capacity_refresh_retry_interval; one
     * that broke the connection retires it before the lease is handed out.
     *
     * ERRORS:
     * - PoolUnavailable: Pool disabled or no connection sources
     * - ConnectionCreationFailed: Session factory failed, never retried here
     * - Cancelled: Token fired while waiting
     * - Timeout: acquire_timeout elapsed
     * - Shutdown: Pool permanently closed
     */
    class ConnectionPool {
       public:
        using clock_type = std::chrono::steady_clock;

        /// @brief How a connection comes back from a lease.
        struct ReleaseDisposition {
            bool faulted{false};
            std::optional<clock_type::time_point> throttled_until;
        };

        /**
         * @brief Exclusive, time-bounded borrow of one Connection.
         *
         * Released on destruction, on move-assignment and by release().
         * Releasing twice is a no-op; using a released lease yields
         * InvalidLease.
         */
        class Lease {
           public:
            Lease() = default;

            Lease(Lease&& other) noexcept { move_from(std::move(other)); }

            /// @brief Move lease from another
            Lease& operator=(Lease&& other) noexcept {
                if (this != &other) {
                    reset();
                    move_from(std::move(other));
                }
                return *this;
            }

            Lease(Lease const&) = delete;
            Lease& operator=(Lease const&) = delete;

            ~Lease() { reset(); }

            Connection* operator->() const noexcept { return get(); }

            Connection& operator*() const { return *get(); }

            /// @brief Get the underlying connection, or nullptr if inert
            Connection* get() const noexcept {
                auto st = state_.lock();
                if (!st || !st->alive.load(std::memory_order_acquire))
                    return nullptr;
                return conn_;
            }

            explicit operator bool() const noexcept { return get() != nullptr; }

            std::uint64_t id() const noexcept { return id_; }

            /// @brief Send one batch through the leased connection.
            boost::asio::awaitable<Result<BatchResponse>> execute(
                BatchRequest request) {
                Connection* c = get();
                if (!c) {
                    co_return Result<BatchResponse>::err(
                        Error::Code::InvalidLease,
                        "Lease used after release");
                }
                if (auto st = state_.lock()) {
                    st->requests_served.fetch_add(1,
                                                  std::memory_order_relaxed);
                }
                auto response = co_await c->execute(std::move(request));
                co_return Result<BatchResponse>::ok(std::move(response));
            }

            /// @brief Query the recommended parallelism through this lease.
            boost::asio::awaitable<Result<std::size_t>>
            recommended_parallelism() {
                Connection* c = get();
                if (!c) {
                    co_return Result<std::size_t>::err(
                        Error::Code::InvalidLease,
                        "Lease used after release");
                }
                co_return co_await c->recommended_parallelism();
            }

            /// @brief Retire the connection when this lease is released.
            void mark_faulted() noexcept { disposition_.faulted = true; }

            /// @brief Return the connection flagged as throttled.
            void mark_throttled(
                std::optional<std::chrono::milliseconds> retry_after) noexcept {
                disposition_.throttled_until =
                    clock_type::now() +
                    retry_after.value_or(std::chrono::milliseconds(0));
            }

            /// @brief Hand the connection back to the pool now. Idempotent.
            void release() noexcept { reset(); }

           private:
            friend class ConnectionPool;

            /// @brief Internal state shared with the pool
            /// @note Used to detect pool shutdown
            struct State {
                std::atomic<bool> alive{true};
                std::atomic<std::uint64_t> requests_served{0};
            };

            using ReturnFn =
                std::function<void(std::uint64_t, ReleaseDisposition)>;

            Lease(std::weak_ptr<State> st, Connection* c, std::uint64_t id,
                  ReturnFn ret)
                : state_(std::move(st)),
                  conn_(c),
                  id_(id),
                  return_to_pool_(std::move(ret)) {}

            /// @brief Return the connection to the pool if still valid
            void reset() noexcept {
                if (!conn_) return;
                auto st = state_.lock();

                // If pool is already dead, do not call back into it.
                if (st && st->alive.load(std::memory_order_acquire) &&
                    return_to_pool_) {
                    return_to_pool_(id_, disposition_);
                }
                conn_ = nullptr;
                disposition_ = {};
            }

            void move_from(Lease&& other) noexcept {
                state_ = std::move(other.state_);
                conn_ = std::exchange(other.conn_, nullptr);
                id_ = std::exchange(other.id_, 0);
                return_to_pool_ = std::move(other.return_to_pool_);
                disposition_ = std::exchange(other.disposition_, {});
            }

            std::weak_ptr<State> state_;
            Connection* conn_{nullptr};
            std::uint64_t id_{0};
            ReturnFn return_to_pool_;
            ReleaseDisposition disposition_{};
        };

        /**
         * @brief Constructs a pool; no connection is created until the first
         * acquire.
         * @param ex Executor timers and waiters run on.
         * @param factory Credential provider creating sessions.
         * @param sources Identities used round-robin for new connections.
         * @param cfg Pool configuration.
         */
        ConnectionPool(boost::asio::any_io_executor ex,
                       std::shared_ptr<SessionFactory> factory,
                       std::vector<ConnectionSource> sources,
                       ConnectionPoolConfiguration cfg);

        ConnectionPool(const ConnectionPool&) = delete;
        ConnectionPool& operator=(const ConnectionPool&) = delete;

        ~ConnectionPool();

        /// @brief False when disabled by configuration or without sources.
        bool is_enabled() const noexcept;

        /// @brief Lease an idle connection without waiting or creating one.
        std::optional<Lease> try_acquire();

        /// @brief Lease a connection, waiting up to the configured
        /// acquire_timeout.
        boost::asio::awaitable<Result<Lease>> acquire(
            CancellationToken token = {});

        /// @brief Lease a connection, waiting at most @p timeout.
        boost::asio::awaitable<Result<Lease>> acquire(
            CancellationToken token, clock_type::duration timeout);

        /// @brief Same as lease.release().
        void release(Lease& lease) noexcept { lease.release(); }

        /// @brief Query the recommended parallelism now and apply it.
        /// @return The new effective capacity.
        boost::asio::awaitable<Result<std::size_t>> refresh_capacity(
            CancellationToken token = {});

        /// @brief Snapshot of connection counts.
        PoolStatistics statistics() const;

        std::size_t effective_capacity() const;

        ///@brief Access metrics for monitoring
        ConnectionPoolMetrics const& metrics() const { return metrics_; }

        ConnectionPoolConfiguration const& config() const noexcept {
            return cfg_;
        }

        boost::asio::any_io_executor get_executor() const noexcept {
            return ex_;
        }

        /// Shutdown the pool immediately, canceling all waiters
        void shutdown();

        /// Wait for all in-use connections to be returned (graceful shutdown)
        boost::asio::awaitable<bool> drain(clock_type::duration timeout);

       private:
        /// @brief Waiter for connection availability
        struct Waiter {
            std::shared_ptr<boost::asio::steady_timer> timer;
            bool active{true};  ///< Whether still waiting
        };

        using Timers = std::vector<std::shared_ptr<boost::asio::steady_timer>>;

        Lease make_lease_(Connection* raw);

        std::optional<Lease> try_acquire_locked_(bool respect_capacity);
        bool can_create_locked_() const;
        std::size_t total_locked_() const;
        void trim_idle_locked_(std::vector<std::unique_ptr<Connection>>& dropped);
        ConnectionSource next_source_locked_();
        std::shared_ptr<boost::asio::steady_timer> pop_waiter_locked_();
        Timers pop_all_waiters_locked_();

        boost::asio::awaitable<Result<std::unique_ptr<Connection>>>
        create_connection_(ConnectionSource source, std::uint64_t id);

        /// @brief Refresh capacity when due; empty when the refresh broke
        /// the connection.
        boost::asio::awaitable<std::optional<Lease>> finish_acquire_(
            Lease lease, bool may_refresh);

        boost::asio::awaitable<Result<std::size_t>> query_capacity_(
            Lease& lease);

        void release_(std::uint64_t id, ReleaseDisposition disposition) noexcept;

        void check_invariants_locked_() const;

        boost::asio::any_io_executor ex_;  ///< Executor for async operations
        std::shared_ptr<SessionFactory> factory_;
        std::vector<ConnectionSource> sources_;
        ConnectionPoolConfiguration cfg_;  ///< Pool configuration

        mutable std::mutex mu_;  ///< Mutex for protecting internal state
        std::deque<std::unique_ptr<Connection>> idle_;
        std::unordered_map<std::uint64_t, std::unique_ptr<Connection>> in_use_;
        std::size_t creating_{0};  ///< Slots reserved by in-flight creations

        std::list<Waiter> waiters_;  ///< Stable iterators for removal

        std::size_t effective_capacity_{1};
        clock_type::time_point next_refresh_at_{};  ///< Epoch: refresh due
        bool refreshing_{false};

        std::size_t next_source_{0};
        std::uint64_t next_id_{1};

        std::shared_ptr<Lease::State> state_;  ///< Shared pool state
        ConnectionPoolMetrics metrics_;  ///< Metrics for monitoring
    };

}  // namespace bulk_cpp
