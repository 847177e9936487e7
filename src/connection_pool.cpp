#include "bulk_cpp/connection/connection_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <cassert>
#include <exception>
#include <unordered_set>

namespace bulk_cpp {

    namespace {
        // Upper bound of a single waiter sleep. A wake-up that races the
        // start of async_wait is picked up on the next slice.
        constexpr std::chrono::milliseconds kWaitSlice{100};

        void cancel_timers(
            std::vector<std::shared_ptr<boost::asio::steady_timer>> const&
                timers) {
            for (auto const& t : timers) {
                if (t) t->cancel();
            }
        }
    }  // namespace

    using awaitable_lease =
        boost::asio::awaitable<Result<ConnectionPool::Lease>>;

    ConnectionPool::ConnectionPool(boost::asio::any_io_executor ex,
                                   std::shared_ptr<SessionFactory> factory,
                                   std::vector<ConnectionSource> sources,
                                   ConnectionPoolConfiguration cfg)
        : ex_(std::move(ex)),
          factory_(std::move(factory)),
          sources_(std::move(sources)),
          cfg_(std::move(cfg)),
          state_(std::make_shared<Lease::State>()) {
        if (cfg_.max_pool_size == 0) cfg_.max_pool_size = 1;
        if (is_enabled()) {
            spdlog::info(
                "Connection pool ready: {} connection source(s), max pool "
                "size {}",
                sources_.size(), cfg_.max_pool_size);
        } else {
            spdlog::warn(
                "Connection pool is disabled (enabled={}, sources={})",
                cfg_.enabled, sources_.size());
        }
    }

    ConnectionPool::~ConnectionPool() {
        shutdown();

        std::deque<std::unique_ptr<Connection>> idle;
        {
            std::lock_guard<std::mutex> lk(mu_);
            idle.swap(idle_);
        }
        // Leased connections die with in_use_; outstanding leases see
        // alive == false and never call back.
    }

    bool ConnectionPool::is_enabled() const noexcept {
        return cfg_.enabled && !sources_.empty() && factory_ != nullptr;
    }

    std::optional<ConnectionPool::Lease> ConnectionPool::try_acquire() {
        std::lock_guard<std::mutex> lk(mu_);
        auto lease = try_acquire_locked_(/*respect_capacity=*/true);
        if (lease) {
            metrics_.acquire_success.fetch_add(1, std::memory_order_relaxed);
        }
        return lease;
    }

    awaitable_lease ConnectionPool::acquire(CancellationToken token) {
        clock_type::duration timeout = clock_type::duration::max();
        if (cfg_.acquire_timeout.count() > 0) timeout = cfg_.acquire_timeout;
        co_return co_await acquire(std::move(token), timeout);
    }

    awaitable_lease ConnectionPool::acquire(CancellationToken token,
                                            clock_type::duration timeout) {
        if (!is_enabled()) {
            metrics_.acquire_unavailable.fetch_add(1,
                                                   std::memory_order_relaxed);
            co_return Result<Lease>::err(
                Error::Code::PoolUnavailable,
                "Connection pool is disabled or has no connection sources");
        }

        const auto start = clock_type::now();
        const auto deadline = (timeout == clock_type::duration::max() ||
                               timeout > clock_type::time_point::max() - start)
                                  ? clock_type::time_point::max()
                                  : start + timeout;
        // Set once a capacity query broke a connection during this acquire
        bool refresh_broke = false;

        for (;;) {
            if (token.is_cancelled()) {
                metrics_.acquire_cancelled.fetch_add(
                    1, std::memory_order_relaxed);
                co_return Result<Lease>::err(Error::Code::Cancelled,
                                             "Acquire cancelled");
            }
            if (!state_->alive.load(std::memory_order_acquire)) {
                metrics_.acquire_shutdown.fetch_add(1,
                                                    std::memory_order_relaxed);
                co_return Result<Lease>::err(Error::Code::Shutdown,
                                             "Pool is shutting down");
            }

            std::optional<Lease> lease;
            std::optional<ConnectionSource> create_from;
            std::uint64_t create_id = 0;
            std::shared_ptr<boost::asio::steady_timer> timer;
            std::list<Waiter>::iterator my_waiter_it;

            {
                std::lock_guard<std::mutex> lk(mu_);

                lease = try_acquire_locked_(/*respect_capacity=*/true);
                if (!lease) {
                    if (can_create_locked_()) {
                        // Reserve the slot before leaving the lock
                        ++creating_;
                        create_from = next_source_locked_();
                        create_id = next_id_++;
                    } else {
                        timer = std::make_shared<boost::asio::steady_timer>(ex_);
                        auto wake_at = clock_type::now() + kWaitSlice;
                        timer->expires_at(std::min(wake_at, deadline));
                        my_waiter_it = waiters_.emplace(waiters_.end(),
                                                        Waiter{timer, true});
                        metrics_.waiters_total.fetch_add(
                            1, std::memory_order_relaxed);
                    }
                }
            }

            if (lease) {
                if (auto ready = co_await finish_acquire_(std::move(*lease),
                                                         !refresh_broke)) {
                    metrics_.acquire_success.fetch_add(
                        1, std::memory_order_relaxed);
                    co_return Result<Lease>::ok(std::move(*ready));
                }
                refresh_broke = true;
                continue;
            }

            if (create_from) {
                auto created = co_await create_connection_(*create_from,
                                                           create_id);

                std::shared_ptr<boost::asio::steady_timer> wake;
                std::optional<Lease> fresh;
                {
                    std::lock_guard<std::mutex> lk(mu_);
                    --creating_;
                    if (created.has_value() &&
                        state_->alive.load(std::memory_order_acquire)) {
                        auto conn = std::move(created).value();
                        Connection* raw = conn.get();
                        raw->set_state(ConnectionState::Leased);
                        in_use_.emplace(create_id, std::move(conn));
                        metrics_.total_in_use.store(
                            in_use_.size(), std::memory_order_relaxed);
                        fresh.emplace(make_lease_(raw));
                        check_invariants_locked_();
                    } else {
                        // Slot freed, let someone else try
                        wake = pop_waiter_locked_();
                    }
                }
                if (wake) wake->cancel();

                if (created.has_error()) {
                    metrics_.connection_creation_failed.fetch_add(
                        1, std::memory_order_relaxed);
                    spdlog::error("Failed to create connection from '{}': {}",
                                  create_from->name, created.error().message);
                    co_return Result<Lease>::err(
                        Error::Code::ConnectionCreationFailed,
                        created.error().message);
                }
                if (!fresh) {
                    metrics_.acquire_shutdown.fetch_add(
                        1, std::memory_order_relaxed);
                    co_return Result<Lease>::err(Error::Code::Shutdown,
                                                 "Pool is shutting down");
                }

                metrics_.connection_created.fetch_add(
                    1, std::memory_order_relaxed);
                spdlog::debug("Created connection #{} from '{}'", create_id,
                              create_from->name);
                if (auto ready = co_await finish_acquire_(std::move(*fresh),
                                                         !refresh_broke)) {
                    metrics_.acquire_success.fetch_add(
                        1, std::memory_order_relaxed);
                    co_return Result<Lease>::ok(std::move(*ready));
                }
                refresh_broke = true;
                continue;
            }

            // Wait for a release, a capacity change, cancellation or the
            // end of the slice.
            auto registration = token.on_cancel([timer] { timer->cancel(); });

            boost::system::error_code ec;
            co_await timer->async_wait(
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            registration.reset();

            {
                std::lock_guard<std::mutex> lk(mu_);
                if (my_waiter_it->active) {
                    metrics_.waiters_total.fetch_sub(
                        1, std::memory_order_relaxed);
                }
                waiters_.erase(my_waiter_it);
            }

            if (clock_type::now() >= deadline) {
                metrics_.acquire_timeout.fetch_add(1,
                                                   std::memory_order_relaxed);
                co_return Result<Lease>::err(Error::Code::Timeout,
                                             "Acquire timeout");
            }
        }
    }

    boost::asio::awaitable<Result<std::size_t>>
    ConnectionPool::refresh_capacity(CancellationToken token) {
        std::optional<Lease> lease;
        {
            std::lock_guard<std::mutex> lk(mu_);
            // An idle connection is already counted, borrowing it for the
            // query does not add a connection even when over capacity.
            lease = try_acquire_locked_(/*respect_capacity=*/false);
        }

        if (!lease) {
            auto acquired = co_await acquire(token);
            if (acquired.has_error()) {
                co_return Result<std::size_t>::err(acquired.error());
            }
            lease.emplace(std::move(acquired).value());
        }

        co_return co_await query_capacity_(*lease);
    }

    PoolStatistics ConnectionPool::statistics() const {
        PoolStatistics s;
        std::lock_guard<std::mutex> lk(mu_);
        s.active_connections = in_use_.size();
        for (auto const& c : idle_) {
            if (c->state() == ConnectionState::Throttled)
                ++s.throttled_connections;
            else
                ++s.idle_connections;
        }
        s.total_connections = idle_.size() + in_use_.size();
        s.requests_served =
            state_->requests_served.load(std::memory_order_relaxed);
        s.effective_capacity = effective_capacity_;
        return s;
    }

    std::size_t ConnectionPool::effective_capacity() const {
        std::lock_guard<std::mutex> lk(mu_);
        return effective_capacity_;
    }

    void ConnectionPool::shutdown() {
        if (!state_->alive.exchange(false, std::memory_order_acq_rel)) return;

        Timers to_cancel;
        std::deque<std::unique_ptr<Connection>> dropped;
        {
            std::lock_guard<std::mutex> lk(mu_);
            // Waiters erase their own entries, only wake them here
            to_cancel = pop_all_waiters_locked_();
            if (cfg_.close_on_shutdown) {
                dropped.swap(idle_);
                metrics_.total_idle.store(0, std::memory_order_relaxed);
            }
        }
        cancel_timers(to_cancel);
        spdlog::info("Connection pool shut down ({} idle connection(s) closed)",
                     dropped.size());
    }

    boost::asio::awaitable<bool> ConnectionPool::drain(
        clock_type::duration timeout) {
        auto deadline = clock_type::now() + timeout;

        while (clock_type::now() < deadline) {
            {
                std::lock_guard<std::mutex> lk(mu_);
                if (in_use_.empty()) {
                    co_return true;  // All connections returned
                }
            }

            // Wait a bit before checking again
            auto timer = std::make_shared<boost::asio::steady_timer>(ex_);
            timer->expires_after(std::chrono::milliseconds(100));
            co_await timer->async_wait(boost::asio::use_awaitable);
        }

        co_return false;  // Timeout, some connections still in use
    }

    // ---------------------------------------------------------------------
    // Internals
    // ---------------------------------------------------------------------

    ConnectionPool::Lease ConnectionPool::make_lease_(Connection* raw) {
        return Lease(state_, raw, raw->id(),
                     [this](std::uint64_t id, ReleaseDisposition d) {
                         release_(id, d);
                     });
    }

    std::optional<ConnectionPool::Lease> ConnectionPool::try_acquire_locked_(
        bool respect_capacity) {
        if (!state_->alive.load(std::memory_order_acquire)) {
            return std::nullopt;
        }
        if (respect_capacity && in_use_.size() >= effective_capacity_) {
            return std::nullopt;
        }
        if (idle_.empty()) return std::nullopt;

        // Prefer Idle, then the throttled connection that recovers first
        const auto now = clock_type::now();
        auto best = idle_.end();
        for (auto it = idle_.begin(); it != idle_.end(); ++it) {
            auto& c = *it;
            if (c->state() == ConnectionState::Idle ||
                c->throttled_until() <= now) {
                best = it;
                break;
            }
            if (best == idle_.end() ||
                c->throttled_until() < (*best)->throttled_until()) {
                best = it;
            }
        }

        auto conn = std::move(*best);
        idle_.erase(best);
        metrics_.total_idle.store(idle_.size(), std::memory_order_relaxed);

        Connection* raw = conn.get();
        raw->set_state(ConnectionState::Leased);
        in_use_.emplace(raw->id(), std::move(conn));

        metrics_.total_in_use.store(in_use_.size(), std::memory_order_relaxed);
        metrics_.connection_reused.fetch_add(1, std::memory_order_relaxed);

        check_invariants_locked_();
        return make_lease_(raw);
    }

    std::size_t ConnectionPool::total_locked_() const {
        return idle_.size() + in_use_.size() + creating_;
    }

    bool ConnectionPool::can_create_locked_() const {
        if (!state_->alive.load(std::memory_order_acquire)) return false;
        // Idle connections are handed out before new ones are created
        return idle_.empty() && total_locked_() < effective_capacity_;
    }

    void ConnectionPool::trim_idle_locked_(
        std::vector<std::unique_ptr<Connection>>& dropped) {
        while (!idle_.empty() && total_locked_() > effective_capacity_) {
            dropped.push_back(std::move(idle_.back()));
            idle_.pop_back();
            metrics_.connection_dropped_capacity.fetch_add(
                1, std::memory_order_relaxed);
        }
        metrics_.total_idle.store(idle_.size(), std::memory_order_relaxed);
    }

    ConnectionSource ConnectionPool::next_source_locked_() {
        auto const& src = sources_[next_source_ % sources_.size()];
        ++next_source_;
        return src;
    }

    std::shared_ptr<boost::asio::steady_timer>
    ConnectionPool::pop_waiter_locked_() {
        for (auto& w : waiters_) {
            if (!w.active) continue;
            w.active = false;
            metrics_.waiters_total.fetch_sub(1, std::memory_order_relaxed);
            return w.timer;
        }
        return {};
    }

    ConnectionPool::Timers ConnectionPool::pop_all_waiters_locked_() {
        Timers out;
        for (auto& w : waiters_) {
            if (!w.active) continue;
            w.active = false;
            metrics_.waiters_total.fetch_sub(1, std::memory_order_relaxed);
            out.push_back(w.timer);
        }
        return out;
    }

    boost::asio::awaitable<Result<std::unique_ptr<Connection>>>
    ConnectionPool::create_connection_(ConnectionSource source,
                                       std::uint64_t id) {
        std::optional<Result<std::unique_ptr<RemoteSession>>> session;
        std::optional<std::string> failure;
        try {
            session.emplace(co_await factory_->create_session(source));
        } catch (const std::exception& e) {
            failure = e.what();
        }

        if (failure) {
            co_return Result<std::unique_ptr<Connection>>::err(
                Error::Code::ConnectionCreationFailed,
                "Session factory threw: " + *failure);
        }
        if (session->has_error()) {
            co_return Result<std::unique_ptr<Connection>>::err(
                Error::Code::ConnectionCreationFailed,
                session->error().message);
        }
        auto remote = std::move(*session).value();
        if (!remote) {
            co_return Result<std::unique_ptr<Connection>>::err(
                Error::Code::ConnectionCreationFailed,
                "Session factory returned no session");
        }

        co_return Result<std::unique_ptr<Connection>>::ok(
            std::make_unique<Connection>(id, source.name, std::move(remote),
                                         !cfg_.disable_affinity_cookie));
    }

    boost::asio::awaitable<std::optional<ConnectionPool::Lease>>
    ConnectionPool::finish_acquire_(Lease lease, bool may_refresh) {
        bool due = false;
        if (may_refresh) {
            std::lock_guard<std::mutex> lk(mu_);
            if (!refreshing_ && clock_type::now() >= next_refresh_at_) {
                refreshing_ = true;
                due = true;
            }
        }
        if (due) {
            auto refreshed = co_await query_capacity_(lease);
            if (refreshed.has_error() &&
                refreshed.error().code == Error::Code::TransportFault) {
                // query_capacity_ flagged the lease; releasing it retires
                // the connection and the caller acquires another one.
                lease.release();
                co_return std::nullopt;
            }
        }
        co_return std::optional<Lease>(std::move(lease));
    }

    boost::asio::awaitable<Result<std::size_t>> ConnectionPool::query_capacity_(
        Lease& lease) {
        auto hint = co_await lease.recommended_parallelism();

        Timers to_wake;
        std::vector<std::unique_ptr<Connection>> dropped;
        std::size_t before = 0;
        std::size_t after = 0;
        {
            std::lock_guard<std::mutex> lk(mu_);
            refreshing_ = false;
            before = effective_capacity_;
            if (hint.has_value()) {
                effective_capacity_ =
                    std::clamp<std::size_t>(hint.value(), 1, cfg_.max_pool_size);
                next_refresh_at_ =
                    clock_type::now() + cfg_.capacity_refresh_interval;
                trim_idle_locked_(dropped);
                if (effective_capacity_ > before) {
                    to_wake = pop_all_waiters_locked_();
                }
            } else {
                next_refresh_at_ =
                    clock_type::now() +
                    std::min(cfg_.capacity_refresh_interval,
                             cfg_.capacity_refresh_retry_interval);
            }
            after = effective_capacity_;
        }
        cancel_timers(to_wake);

        if (hint.has_error()) {
            if (hint.error().code == Error::Code::TransportFault) {
                lease.mark_faulted();
            }
            metrics_.capacity_refresh_failed.fetch_add(
                1, std::memory_order_relaxed);
            spdlog::warn("Recommended parallelism query failed: {}",
                         hint.error().message);
            co_return Result<std::size_t>::err(hint.error());
        }

        metrics_.capacity_refreshes.fetch_add(1, std::memory_order_relaxed);
        if (before != after) {
            spdlog::info(
                "Effective pool capacity {} -> {} (service recommends {}, "
                "max pool size {})",
                before, after, hint.value(), cfg_.max_pool_size);
        }
        co_return Result<std::size_t>::ok(after);
    }

    void ConnectionPool::release_(std::uint64_t id,
                                  ReleaseDisposition disposition) noexcept {
        std::shared_ptr<boost::asio::steady_timer> w;
        std::unique_ptr<Connection> retired;

        {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = in_use_.find(id);
            if (it == in_use_.end()) {
                metrics_.release_invalid_id.fetch_add(
                    1, std::memory_order_relaxed);
                return;
            }

            auto conn = std::move(it->second);
            in_use_.erase(it);
            metrics_.total_in_use.store(in_use_.size(),
                                        std::memory_order_relaxed);

            if (disposition.faulted) {
                conn->set_state(ConnectionState::Faulted);
                metrics_.connection_retired_faulted.fetch_add(
                    1, std::memory_order_relaxed);
                retired = std::move(conn);
            } else if (total_locked_() + 1 > effective_capacity_) {
                // Capacity shrank while this one was out
                metrics_.connection_dropped_capacity.fetch_add(
                    1, std::memory_order_relaxed);
                retired = std::move(conn);
            } else {
                if (disposition.throttled_until) {
                    conn->set_state(ConnectionState::Throttled);
                    conn->set_throttled_until(*disposition.throttled_until);
                    metrics_.connection_throttled.fetch_add(
                        1, std::memory_order_relaxed);
                } else {
                    conn->set_state(ConnectionState::Idle);
                }
                idle_.push_back(std::move(conn));
                metrics_.total_idle.store(idle_.size(),
                                          std::memory_order_relaxed);
            }

            // Pop waiter UNDER LOCK, but don't cancel just yet
            w = pop_waiter_locked_();
            check_invariants_locked_();
        }

        if (retired && retired->state() == ConnectionState::Faulted) {
            spdlog::debug("Retired faulted connection #{} ('{}')",
                          retired->id(), retired->source_name());
        }

        // Cancel OUTSIDE lock to avoid deadlock
        if (w) w->cancel();
    }

    /// @note Debug builds only
    void ConnectionPool::check_invariants_locked_() const {
#ifndef NDEBUG
        std::unordered_set<Connection const*> in_use_ptrs;
        for (auto const& [id, up] : in_use_) {
            assert(up && "in_use connection is null");
            assert(up->id() == id && "in_use key does not match id");
            assert(up->state() == ConnectionState::Leased &&
                   "in_use connection not Leased");
            in_use_ptrs.insert(up.get());
        }
        for (auto const& c : idle_) {
            assert(c && "idle connection is null");
            assert(in_use_ptrs.find(c.get()) == in_use_ptrs.end() &&
                   "connection in both idle and in_use");
            assert((c->state() == ConnectionState::Idle ||
                    c->state() == ConnectionState::Throttled) &&
                   "idle connection in wrong state");
        }
        assert(effective_capacity_ >= 1 && "capacity below 1");
#endif
    }

}  // namespace bulk_cpp
