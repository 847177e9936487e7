#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace bulk_cpp {

    /// @brief Point-in-time view of the pool, for callers and dashboards.
    struct PoolStatistics {
        std::size_t total_connections{0};   ///< Idle + leased + throttled
        std::size_t active_connections{0};  ///< Currently leased out
        std::size_t idle_connections{0};    ///< Idle and not throttled
        std::size_t throttled_connections{0};  ///< Idle, last call throttled
        std::uint64_t requests_served{0};      ///< Lifetime batch calls
        std::size_t effective_capacity{1};     ///< Current connection ceiling
    };

    /// @brief Metrics for monitoring connection pool behavior
    struct ConnectionPoolMetrics {
        // Gauges (current state)
        std::atomic<std::size_t> total_in_use{0};  ///< Currently leased out
        std::atomic<std::size_t> total_idle{0};    ///< Currently idle
        std::atomic<std::size_t> waiters_total{
            0};  ///< Currently waiting for a connection

        // Counters (cumulative)
        std::atomic<std::uint64_t> acquire_success{0};  ///< Successful acquires
        std::atomic<std::uint64_t> acquire_timeout{0};  ///< Acquire timed out
        std::atomic<std::uint64_t> acquire_cancelled{0};  ///< Token fired
        std::atomic<std::uint64_t> acquire_shutdown{0};   ///< Pool shutdown
        std::atomic<std::uint64_t> acquire_unavailable{
            0};  ///< Pool disabled / unconfigured
        std::atomic<std::uint64_t> connection_created{0};  ///< New connections
        std::atomic<std::uint64_t> connection_creation_failed{
            0};                                            ///< Factory failed
        std::atomic<std::uint64_t> connection_reused{0};   ///< Reused idle
        std::atomic<std::uint64_t> connection_retired_faulted{
            0};  ///< Dropped after a fault
        std::atomic<std::uint64_t> connection_dropped_capacity{
            0};  ///< Dropped because capacity shrank
        std::atomic<std::uint64_t> connection_throttled{
            0};  ///< Returned flagged as throttled
        std::atomic<std::uint64_t> capacity_refreshes{
            0};  ///< Successful parallelism queries
        std::atomic<std::uint64_t> capacity_refresh_failed{
            0};  ///< Failed parallelism queries

        std::atomic<std::uint64_t> release_invalid_id{
            0};  ///< Released unknown connection
    };

}  // namespace bulk_cpp
