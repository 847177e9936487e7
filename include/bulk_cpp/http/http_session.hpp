#pragma once

#include <utility>  // before Boost.Asio: boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "bulk_cpp/config.hpp"
#include "bulk_cpp/http/service_url.hpp"
#include "bulk_cpp/operation.hpp"
#include "bulk_cpp/remote_session.hpp"
#include "bulk_cpp/result.hpp"

namespace bulk_cpp {

    /// @brief Transport settings of HTTP sessions.
    struct HttpSessionOptions {
        std::string user_agent{"bulk_cpp/1.0"};
        bool verify_tls{true};
        /// Applies to connect, TLS handshake, write and read separately.
        std::chrono::milliseconds request_timeout{120000};
    };

    /// @brief Cookie carrying the service's session affinity.
    inline constexpr std::string_view kAffinityCookieName = "ARRAffinity";

    /// @brief Response header carrying the recommended parallelism.
    inline constexpr std::string_view kParallelismHintHeader = "x-ms-dop-hint";

    /// @brief Query value of an operation in the batch endpoint.
    const char* operation_query_value(OperationKind kind) noexcept;

    /// @brief JSON body of one batch call:
    /// {"records":[{"id":..,"payload":..}]}. A payload that is valid JSON is
    /// embedded as is, anything else as a string.
    std::string encode_batch_body(BatchRequest const& request);

    /**
     * @brief Map an HTTP reply of the batch endpoint to a BatchOutcome.
     * @param status HTTP status code.
     * @param body Response body.
     * @param retry_after Raw Retry-After header (delta seconds), if present.
     * @param record_count Records sent in the batch.
     */
    BatchOutcome interpret_batch_response(
        int status, std::string_view body,
        std::optional<std::string_view> retry_after, std::size_t record_count);

    /// @brief "ARRAffinity=<value>" out of a Set-Cookie header value, if that
    /// cookie is the one being set.
    std::optional<std::string> extract_affinity_cookie(
        std::string_view set_cookie);

    /**
     * @brief RemoteSession over one keep-alive HTTP(S) connection.
     *
     * Not thread-safe: the pool hands a session to one lease at a time.
     * A socket or protocol error closes the stream; the pool retires the
     * Connection because the outcome is a transport fault.
     */
    class HttpSession final : public RemoteSession {
       public:
        HttpSession(boost::asio::any_io_executor ex,
                    boost::asio::ssl::context& ssl_ctx, ServiceUrl url,
                    std::string access_token, HttpSessionOptions options);

        HttpSession(const HttpSession&) = delete;
        HttpSession& operator=(const HttpSession&) = delete;

        ~HttpSession() override { close(); }

        boost::asio::awaitable<BatchResponse> execute_batch(
            BatchRequest const& request) override;

        boost::asio::awaitable<Result<std::size_t>> recommended_parallelism()
            override;

        /// @brief Open the stream now; used to surface connect errors at
        /// creation time.
        boost::asio::awaitable<boost::system::error_code> connect();

        /// @brief Close the stream if open (best-effort).
        void close() noexcept;

        bool is_open() const noexcept;

       private:
        using HttpStream = boost::beast::tcp_stream;
        using HttpsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;
        using Stream = std::variant<std::monostate, HttpStream, HttpsStream>;
        using BeastRequest =
            boost::beast::http::request<boost::beast::http::string_body>;
        using BeastResponse =
            boost::beast::http::response<boost::beast::http::string_body>;

        BeastRequest make_request_(boost::beast::http::verb verb,
                                   std::string target) const;

        /// @brief One request/response exchange, reconnecting if needed.
        boost::asio::awaitable<boost::system::error_code> round_trip_(
            BeastRequest& req, BeastResponse& res);

        boost::asio::any_io_executor ex_;
        boost::asio::ssl::context& ssl_ctx_;
        ServiceUrl url_;
        std::string access_token_;
        HttpSessionOptions options_;

        boost::beast::flat_buffer buffer_{};
        Stream stream_;
    };

    /**
     * @brief SessionFactory producing HttpSessions for one environment.
     *
     * Each ConnectionSource must carry an access token; acquiring tokens is
     * left to the caller.
     */
    class HttpSessionFactory final : public SessionFactory {
       public:
        /// @throws std::runtime_error if the TLS context cannot load the
        /// system CA store.
        HttpSessionFactory(boost::asio::any_io_executor ex,
                           std::string service_url,
                           HttpSessionOptions options = {});

        boost::asio::awaitable<Result<std::unique_ptr<RemoteSession>>>
        create_session(ConnectionSource const& source) override;

       private:
        boost::asio::any_io_executor ex_;
        std::string service_url_;
        HttpSessionOptions options_;
        boost::asio::ssl::context ssl_ctx_;
    };

}  // namespace bulk_cpp
