#pragma once

#include <atomic>
#include <utility>  // before Boost.Asio: boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>

#include "bulk_cpp/operation.hpp"
#include "bulk_cpp/remote_session.hpp"
#include "bulk_cpp/result.hpp"

namespace bulk_cpp {

    /** @brief Pool-visible state of a Connection. */
    enum class ConnectionState : std::uint8_t {
        Idle,       /**< In the idle set, ready to lease. */
        Leased,     /**< Held by exactly one Lease. */
        Throttled,  /**< In the idle set, last call was throttled. */
        Faulted     /**< Broken; about to be destroyed. */
    };

    inline constexpr const char* to_string(ConnectionState s) {
        switch (s) {
            case ConnectionState::Idle:
                return "Idle";
            case ConnectionState::Leased:
                return "Leased";
            case ConnectionState::Throttled:
                return "Throttled";
            case ConnectionState::Faulted:
                return "Faulted";
        }
        return "Unknown";
    }

    class ConnectionPool;

    /**
     * @brief One authenticated session to the remote service plus the
     * bookkeeping the pool needs.
     *
     * Callers never own a Connection; they reach it through a
     * ConnectionPool::Lease. Only the pool changes its state.
     */
    class Connection {
       public:
        using clock_type = std::chrono::steady_clock;

        Connection(std::uint64_t id, std::string source_name,
                   std::unique_ptr<RemoteSession> session,
                   bool affinity_enabled)
            : id_(id),
              source_name_(std::move(source_name)),
              session_(std::move(session)),
              affinity_enabled_(affinity_enabled),
              created_at_(clock_type::now()),
              last_used_(created_at_) {}

        Connection(const Connection&) = delete;
        Connection& operator=(const Connection&) = delete;
        Connection(Connection&&) = delete;
        Connection& operator=(Connection&&) = delete;

        /**
         * @brief Send one batch over this session.
         *
         * Attaches the affinity token (unless affinity is disabled), keeps the
         * token the service hands back and counts the request. An exception
         * thrown by the session becomes a BatchTransportFault.
         */
        boost::asio::awaitable<BatchResponse> execute(BatchRequest request) {
            if (affinity_enabled_) {
                request.affinity_token = affinity_token_;
            } else {
                request.affinity_token.reset();
            }

            requests_served_.fetch_add(1, std::memory_order_relaxed);
            last_used_ = clock_type::now();

            BatchResponse response;
            std::optional<std::string> failure;
            try {
                response = co_await session_->execute_batch(request);
            } catch (const std::exception& e) {
                failure = e.what();
            }

            if (failure) {
                co_return BatchResponse{
                    BatchTransportFault{"Session threw: " + *failure, false},
                    std::nullopt};
            }

            if (affinity_enabled_ && response.affinity_token) {
                affinity_token_ = response.affinity_token;
            }
            co_return response;
        }

        /// @brief Ask the service for its recommended client parallelism.
        boost::asio::awaitable<Result<std::size_t>> recommended_parallelism() {
            std::optional<std::string> failure;
            std::optional<Result<std::size_t>> hint;
            try {
                hint.emplace(co_await session_->recommended_parallelism());
            } catch (const std::exception& e) {
                failure = e.what();
            }
            if (failure) {
                co_return Result<std::size_t>::err(
                    Error::Code::TransportFault,
                    "Parallelism query threw: " + *failure);
            }
            co_return std::move(*hint);
        }

        std::uint64_t id() const noexcept { return id_; }

        /// @brief Name of the ConnectionSource this session authenticated as.
        std::string const& source_name() const noexcept { return source_name_; }

        ConnectionState state() const noexcept {
            return state_.load(std::memory_order_acquire);
        }

        clock_type::time_point created_at() const noexcept {
            return created_at_;
        }

        clock_type::time_point last_used() const noexcept { return last_used_; }

        /// @brief Until when the service asked us to back off, if throttled.
        clock_type::time_point throttled_until() const noexcept {
            return throttled_until_;
        }

        std::uint64_t requests_served() const noexcept {
            return requests_served_.load(std::memory_order_relaxed);
        }

        std::optional<std::string> const& affinity_token() const noexcept {
            return affinity_token_;
        }

        bool affinity_enabled() const noexcept { return affinity_enabled_; }

       private:
        friend class ConnectionPool;

        void set_state(ConnectionState s) noexcept {
            state_.store(s, std::memory_order_release);
        }

        void set_throttled_until(clock_type::time_point t) noexcept {
            throttled_until_ = t;
        }

        std::uint64_t id_;
        std::string source_name_;
        std::unique_ptr<RemoteSession> session_;
        bool affinity_enabled_;

        std::atomic<ConnectionState> state_{ConnectionState::Idle};
        clock_type::time_point created_at_;
        clock_type::time_point last_used_;
        clock_type::time_point throttled_until_{};
        std::atomic<std::uint64_t> requests_served_{0};

        std::optional<std::string> affinity_token_;
    };

}  // namespace bulk_cpp
