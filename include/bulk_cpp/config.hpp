#pragma once
#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "bulk_cpp/rate/rate_preset.hpp"

namespace bulk_cpp {
    /**
     * @brief One identity the pool can authenticate as.
     *
     * Token acquisition is not this library's concern: a SessionFactory
     * turns a source into an authenticated session.
     */
    struct ConnectionSource {
        /** @brief Name used in logs. */
        std::string name;
        std::string client_id;
        std::string client_secret;
        /** @brief Pre-acquired bearer token, if the factory uses one. */
        std::string access_token;
    };

    /**
     * @brief A named target environment (e.g. "Dev", "QA").
     */
    struct EnvironmentConfiguration {
        std::string name;
        /** @brief Service root URL of the environment. */
        std::string url;
        /** @brief Identities used round-robin when creating connections. */
        std::vector<ConnectionSource> connections;
    };

    /**
     * @brief Configuration for the connection pool.
     */
    struct ConnectionPoolConfiguration {
        /** @brief A disabled pool fails every acquire with PoolUnavailable. */
        bool enabled{true};

        /** @brief Ceiling on connections; the effective capacity is the
         * service's recommended parallelism clamped to [1, max_pool_size]. */
        std::size_t max_pool_size{52};

        /** @brief How often the recommended parallelism is re-queried. */
        std::chrono::milliseconds capacity_refresh_interval{300000};

        /** @brief Delay before a failed parallelism query is retried, capped
         * by capacity_refresh_interval. */
        std::chrono::milliseconds capacity_refresh_retry_interval{5000};

        /** @brief Maximum wait for a lease; zero means wait forever. */
        std::chrono::milliseconds acquire_timeout{0};

        /** @brief Never attach or keep session-affinity tokens. */
        bool disable_affinity_cookie{false};

        /** @brief Drop idle connections when the pool shuts down. */
        bool close_on_shutdown{true};
    };

    /**
     * @brief Defaults for bulk operations.
     */
    struct BulkOperationConfiguration {
        /** @brief Records per remote batch call. */
        std::size_t default_batch_size{100};

        /** @brief Hard cap on concurrently running batches, on top of the
         * Rate Controller budget. */
        std::optional<std::size_t> max_parallel_batches;

        /** @brief Throttle retries before a batch fails. */
        std::size_t max_throttle_retries{5};

        /** @brief First throttle backoff; doubles on every retry. */
        std::chrono::milliseconds throttle_backoff_base{1000};

        /** @brief Upper bound of the throttle backoff. */
        std::chrono::milliseconds throttle_backoff_max{60000};

        /** @brief Retries on a fresh connection after a transport fault. */
        std::size_t transport_retry_count{1};

        /** @brief Preset used when the caller does not pick one (Delete
         * operations default to Conservative). */
        RatePreset default_rate_preset{RatePreset::Balanced};
    };

    /**
     * @brief spdlog settings.
     */
    struct LoggingConfiguration {
        /** @brief spdlog level name: trace, debug, info, warn, error, off. */
        std::string level{"info"};
        /** @brief Force debug level. */
        bool verbose{false};
    };

    /**
     * @brief Top-level configuration.
     */
    struct ClientConfiguration {
        /** @brief Environment used when none is named. */
        std::string default_environment;

        std::map<std::string, EnvironmentConfiguration> environments;

        ConnectionPoolConfiguration pool;

        BulkOperationConfiguration bulk;

        LoggingConfiguration logging;

        /// @brief Look up an environment; empty name means the default one.
        const EnvironmentConfiguration* environment(
            const std::string& name = {}) const {
            const std::string& key = name.empty() ? default_environment : name;
            auto it = environments.find(key);
            if (it == environments.end()) {
                // A single configured environment is the implicit default
                if (key.empty() && environments.size() == 1) {
                    return &environments.begin()->second;
                }
                return nullptr;
            }
            return &it->second;
        }
    };
}  // namespace bulk_cpp
