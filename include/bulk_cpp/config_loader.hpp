#pragma once

#include <istream>
#include <string>

#include "bulk_cpp/config.hpp"
#include "bulk_cpp/result.hpp"

namespace bulk_cpp {

    /**
     * @brief Parse an INI configuration.
     *
     * Sections and keys:
     * - [client] default_environment
     * - [pool] enabled, max_pool_size, capacity_refresh_interval_ms,
     *   acquire_timeout_ms, disable_affinity_cookie, close_on_shutdown
     * - [bulk] default_batch_size, max_parallel_batches,
     *   max_throttle_retries, throttle_backoff_base_ms,
     *   throttle_backoff_max_ms, transport_retry_count, default_rate_preset
     * - [logging] level, verbose
     * - [environment.<Name>] url, connections.<i>.name,
     *   connections.<i>.client_id, connections.<i>.client_secret,
     *   connections.<i>.access_token
     *
     * Missing keys keep their defaults.
     * @return ConfigurationError on syntax errors, malformed values, unknown
     * presets or an inconsistent result.
     */
    Result<ClientConfiguration> parse_configuration(std::istream& in);

    /// @brief Read and parse the INI file at @p path.
    Result<ClientConfiguration> load_configuration(std::string const& path);

    /// @brief Set the spdlog default logger level (verbose forces debug).
    void apply_logging_configuration(LoggingConfiguration const& cfg);

}  // namespace bulk_cpp
