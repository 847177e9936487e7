#pragma once

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/error_code.hpp>
#include <cctype>
#include <stdexcept>
#include <string>
#include <string_view>

#include "bulk_cpp/result.hpp"

namespace bulk_cpp {

    /**
     * @brief Service root of one environment, split for Beast.
     */
    struct ServiceUrl {
        bool https{false};
        std::string host;
        std::string port;
        /// Path prefix without trailing '/', "" for the root.
        std::string base_path;

        /// @brief Request target for @p path relative to the service root.
        std::string target(std::string_view path) const {
            std::string out = base_path;
            if (path.empty() || path.front() != '/') out.push_back('/');
            out.append(path);
            return out;
        }

        /// @brief Value of the Host header.
        std::string host_header() const {
            const bool default_port =
                (https && port == "443") || (!https && port == "80");
            return default_port ? host : host + ":" + port;
        }
    };

    /**
     * @brief Parse an absolute service URL such as
     * "https://org.example.com/api/data/v9.2".
     * @return InvalidUrl for a missing scheme, host or port, or a query.
     */
    inline Result<ServiceUrl> parse_service_url(std::string_view url) {
        auto make_err = [](std::string msg) {
            return Result<ServiceUrl>::err(Error::Code::InvalidUrl,
                                           std::move(msg));
        };

        ServiceUrl out;
        std::string_view s = url;
        if (s.rfind("https://", 0) == 0) {
            out.https = true;
            s.remove_prefix(std::string_view("https://").size());
        } else if (s.rfind("http://", 0) == 0) {
            s.remove_prefix(std::string_view("http://").size());
        } else {
            return make_err("Service URL must start with http:// or https://");
        }

        std::string_view hostport = s;
        std::string_view path;
        if (auto slash = s.find('/'); slash != std::string_view::npos) {
            hostport = s.substr(0, slash);
            path = s.substr(slash);
        }
        if (hostport.empty()) return make_err("Service URL missing host");
        if (path.find('?') != std::string_view::npos) {
            return make_err("Service URL must not include query parameters");
        }

        if (auto colon = hostport.rfind(':'); colon != std::string_view::npos) {
            out.host = std::string(hostport.substr(0, colon));
            out.port = std::string(hostport.substr(colon + 1));
            if (out.port.empty()) return make_err("Service URL has empty port");
        } else {
            out.host = std::string(hostport);
            out.port = out.https ? "443" : "80";
        }
        if (out.host.empty()) return make_err("Service URL has empty host");
        std::transform(out.host.begin(), out.host.end(), out.host.begin(),
                       [](unsigned char c) { return std::tolower(c); });

        while (!path.empty() && path.back() == '/') path.remove_suffix(1);
        out.base_path = std::string(path);
        return Result<ServiceUrl>::ok(std::move(out));
    }

    inline bool set_sni(
        boost::beast::ssl_stream<boost::beast::tcp_stream>& stream,
        const std::string& host, boost::system::error_code& ec) {
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
            ec = boost::system::error_code(
                static_cast<int>(::ERR_get_error()),
                boost::asio::error::get_ssl_category());
            return false;
        }
        return true;
    }

    /// @brief Load the system CA store and pick the verification mode.
    inline void init_tls_on_ssl_context(boost::asio::ssl::context& ssl_context,
                                        bool verify_peer) {
        try {
            ssl_context.set_default_verify_paths();
        } catch (const boost::system::system_error& e) {
            throw std::runtime_error(
                std::string("Failed to set default verify paths: ") + e.what());
        }

        ssl_context.set_verify_mode(verify_peer
                                        ? boost::asio::ssl::verify_peer
                                        : boost::asio::ssl::verify_none);
    }

}  // namespace bulk_cpp
