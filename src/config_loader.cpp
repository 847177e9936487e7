#include "bulk_cpp/config_loader.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string_view>

namespace bulk_cpp {

    namespace {
        namespace pt = boost::property_tree;

        constexpr std::string_view kEnvironmentPrefix = "environment.";
        constexpr std::string_view kConnectionsPrefix = "connections.";

        std::string where(std::string const& section, std::string const& key) {
            return "[" + section + "] " + key;
        }

        std::size_t to_size(std::string const& section, std::string const& key,
                            std::string const& value) {
            std::size_t out = 0;
            auto const* first = value.data();
            auto const* last = value.data() + value.size();
            auto [ptr, ec] = std::from_chars(first, last, out);
            if (ec != std::errc{} || ptr != last || value.empty()) {
                throw std::invalid_argument(where(section, key) +
                                            ": expected a non-negative "
                                            "integer, got '" +
                                            value + "'");
            }
            return out;
        }

        bool to_bool(std::string const& section, std::string const& key,
                     std::string const& value) {
            auto v = boost::algorithm::to_lower_copy(value);
            if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
            if (v == "false" || v == "0" || v == "no" || v == "off")
                return false;
            throw std::invalid_argument(where(section, key) +
                                        ": expected a boolean, got '" + value +
                                        "'");
        }

        std::chrono::milliseconds to_ms(std::string const& section,
                                        std::string const& key,
                                        std::string const& value) {
            return std::chrono::milliseconds(
                static_cast<std::int64_t>(to_size(section, key, value)));
        }

        bool is_log_level(std::string const& level) {
            static constexpr std::string_view kLevels[] = {
                "trace", "debug", "info",     "warn",
                "warning", "error", "err", "critical", "off"};
            return std::find(std::begin(kLevels), std::end(kLevels), level) !=
                   std::end(kLevels);
        }

        void read_client(pt::ptree const& section, ClientConfiguration& cfg) {
            for (auto const& [key, node] : section) {
                auto const value = node.data();
                if (key == "default_environment") cfg.default_environment = value;
            }
        }

        void read_pool(pt::ptree const& section,
                       ConnectionPoolConfiguration& pool) {
            const std::string name = "pool";
            for (auto const& [key, node] : section) {
                auto const value = node.data();
                if (key == "enabled")
                    pool.enabled = to_bool(name, key, value);
                else if (key == "max_pool_size")
                    pool.max_pool_size = to_size(name, key, value);
                else if (key == "capacity_refresh_interval_ms")
                    pool.capacity_refresh_interval = to_ms(name, key, value);
                else if (key == "capacity_refresh_retry_interval_ms")
                    pool.capacity_refresh_retry_interval =
                        to_ms(name, key, value);
                else if (key == "acquire_timeout_ms")
                    pool.acquire_timeout = to_ms(name, key, value);
                else if (key == "disable_affinity_cookie")
                    pool.disable_affinity_cookie = to_bool(name, key, value);
                else if (key == "close_on_shutdown")
                    pool.close_on_shutdown = to_bool(name, key, value);
                else
                    spdlog::warn("Ignoring unknown configuration key {}",
                                 where(name, key));
            }
        }

        void read_bulk(pt::ptree const& section,
                       BulkOperationConfiguration& bulk) {
            const std::string name = "bulk";
            for (auto const& [key, node] : section) {
                auto const value = node.data();
                if (key == "default_batch_size")
                    bulk.default_batch_size = to_size(name, key, value);
                else if (key == "max_parallel_batches")
                    bulk.max_parallel_batches = to_size(name, key, value);
                else if (key == "max_throttle_retries")
                    bulk.max_throttle_retries = to_size(name, key, value);
                else if (key == "throttle_backoff_base_ms")
                    bulk.throttle_backoff_base = to_ms(name, key, value);
                else if (key == "throttle_backoff_max_ms")
                    bulk.throttle_backoff_max = to_ms(name, key, value);
                else if (key == "transport_retry_count")
                    bulk.transport_retry_count = to_size(name, key, value);
                else if (key == "default_rate_preset") {
                    auto preset = parse_rate_preset(value);
                    if (!preset) {
                        throw std::invalid_argument(
                            where(name, key) + ": unknown rate preset '" +
                            value + "'");
                    }
                    bulk.default_rate_preset = *preset;
                } else
                    spdlog::warn("Ignoring unknown configuration key {}",
                                 where(name, key));
            }
        }

        void read_logging(pt::ptree const& section,
                          LoggingConfiguration& logging) {
            const std::string name = "logging";
            for (auto const& [key, node] : section) {
                auto const value = node.data();
                if (key == "level") {
                    auto level = boost::algorithm::to_lower_copy(value);
                    if (!is_log_level(level)) {
                        throw std::invalid_argument(where(name, key) +
                                                    ": unknown log level '" +
                                                    value + "'");
                    }
                    logging.level = level;
                } else if (key == "verbose")
                    logging.verbose = to_bool(name, key, value);
            }
        }

        // connections.<i>.<field>
        void read_connection_key(std::string const& section,
                                 std::string const& key,
                                 std::string const& value,
                                 std::map<std::size_t, ConnectionSource>& out) {
            auto rest = std::string_view(key).substr(kConnectionsPrefix.size());
            auto dot = rest.find('.');
            if (dot == std::string_view::npos) {
                throw std::invalid_argument(where(section, key) +
                                            ": expected connections.<i>.<field>");
            }
            auto index = to_size(section, key, std::string(rest.substr(0, dot)));
            auto field = rest.substr(dot + 1);

            auto& src = out[index];
            if (field == "name")
                src.name = value;
            else if (field == "client_id")
                src.client_id = value;
            else if (field == "client_secret")
                src.client_secret = value;
            else if (field == "access_token")
                src.access_token = value;
            else
                throw std::invalid_argument(where(section, key) +
                                            ": unknown connection field");
        }

        EnvironmentConfiguration read_environment(std::string const& section,
                                                  std::string env_name,
                                                  pt::ptree const& tree) {
            EnvironmentConfiguration env;
            env.name = std::move(env_name);

            std::map<std::size_t, ConnectionSource> sources;
            for (auto const& [key, node] : tree) {
                if (key == "url") {
                    env.url = node.data();
                } else if (key.rfind(kConnectionsPrefix, 0) == 0) {
                    read_connection_key(section, key, node.data(), sources);
                }
            }

            if (env.url.empty()) {
                throw std::invalid_argument("[" + section + "] has no url");
            }
            for (auto& [index, src] : sources) {
                if (src.name.empty()) {
                    src.name = env.name + "#" + std::to_string(index);
                }
                env.connections.push_back(std::move(src));
            }
            return env;
        }
    }  // namespace

    Result<ClientConfiguration> parse_configuration(std::istream& in) {
        using R = Result<ClientConfiguration>;
        ClientConfiguration cfg;

        try {
            pt::ptree tree;
            pt::read_ini(in, tree);

            for (auto const& [section, node] : tree) {
                if (section == "client")
                    read_client(node, cfg);
                else if (section == "pool")
                    read_pool(node, cfg.pool);
                else if (section == "bulk")
                    read_bulk(node, cfg.bulk);
                else if (section == "logging")
                    read_logging(node, cfg.logging);
                else if (section.rfind(kEnvironmentPrefix, 0) == 0) {
                    auto name = section.substr(kEnvironmentPrefix.size());
                    if (name.empty()) {
                        return R::err(Error::Code::ConfigurationError,
                                      "Environment section without a name");
                    }
                    cfg.environments[name] =
                        read_environment(section, name, node);
                } else {
                    spdlog::warn("Ignoring unknown configuration section [{}]",
                                 section);
                }
            }
        } catch (const pt::ptree_error& e) {
            return R::err(Error::Code::ConfigurationError, e.what());
        } catch (const std::invalid_argument& e) {
            return R::err(Error::Code::ConfigurationError, e.what());
        }

        if (cfg.pool.max_pool_size < 1) {
            return R::err(Error::Code::ConfigurationError,
                          "[pool] max_pool_size must be at least 1");
        }
        if (cfg.bulk.default_batch_size < 1) {
            return R::err(Error::Code::ConfigurationError,
                          "[bulk] default_batch_size must be at least 1");
        }
        if (cfg.bulk.max_parallel_batches && *cfg.bulk.max_parallel_batches < 1) {
            return R::err(Error::Code::ConfigurationError,
                          "[bulk] max_parallel_batches must be at least 1");
        }
        if (!cfg.default_environment.empty() &&
            cfg.environments.find(cfg.default_environment) ==
                cfg.environments.end()) {
            return R::err(Error::Code::ConfigurationError,
                          "Default environment '" + cfg.default_environment +
                              "' is not configured");
        }

        return R::ok(std::move(cfg));
    }

    Result<ClientConfiguration> load_configuration(std::string const& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return Result<ClientConfiguration>::err(
                Error::Code::ConfigurationError,
                "Cannot open configuration file: " + path);
        }
        auto cfg = parse_configuration(file);
        if (cfg.has_error()) {
            spdlog::error("Invalid configuration in {}: {}", path,
                          cfg.error().message);
        }
        return cfg;
    }

    void apply_logging_configuration(LoggingConfiguration const& cfg) {
        auto level = cfg.verbose ? spdlog::level::debug
                                 : spdlog::level::from_str(cfg.level);
        spdlog::set_level(level);
        spdlog::debug("Log level set to {}",
                      spdlog::level::to_string_view(level));
    }

}  // namespace bulk_cpp
