#include "bulk_cpp/http/http_session.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/stream_base.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/beast/http/write.hpp>
#include <charconv>
#include <nlohmann/json.hpp>

namespace beast = boost::beast;
namespace http = beast::http;

namespace bulk_cpp {

    namespace {
        using tcp = boost::asio::ip::tcp;
        using json = nlohmann::json;

        std::string_view to_std(beast::string_view v) {
            return std::string_view(v.data(), v.size());
        }

        std::optional<std::chrono::milliseconds> parse_retry_after(
            std::optional<std::string_view> raw) {
            if (!raw) return std::nullopt;
            auto v = *raw;
            while (!v.empty() && v.front() == ' ') v.remove_prefix(1);
            while (!v.empty() && v.back() == ' ') v.remove_suffix(1);
            long long seconds = 0;
            auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), seconds);
            // HTTP-date values are not honored; the executor backoff applies
            if (ec != std::errc{} || ptr != v.data() + v.size() || seconds < 0) {
                return std::nullopt;
            }
            constexpr long long limit =
                std::chrono::duration_cast<std::chrono::seconds>(
                    max_retry_after)
                    .count();
            return std::chrono::milliseconds(
                std::chrono::seconds(std::min(seconds, limit)));
        }

        /// @brief "error" or "message" of a JSON error body, else the body.
        std::string error_text(int status, std::string_view body) {
            auto doc = json::parse(body.begin(), body.end(), nullptr, false);
            if (!doc.is_discarded() && doc.is_object()) {
                for (auto const* key : {"error", "message"}) {
                    auto it = doc.find(key);
                    if (it == doc.end()) continue;
                    if (it->is_string()) return it->get<std::string>();
                    if (it->is_object() && it->contains("message") &&
                        (*it)["message"].is_string()) {
                        return (*it)["message"].get<std::string>();
                    }
                }
            }
            std::string out = "HTTP " + std::to_string(status);
            if (!body.empty()) {
                out += ": ";
                out.append(body.substr(0, 256));
            }
            return out;
        }

        std::vector<RecordOutcome> all_failed(std::size_t count,
                                              std::string const& message) {
            return std::vector<RecordOutcome>(
                count, RecordOutcome{false, std::nullopt, message});
        }
    }  // namespace

    const char* operation_query_value(OperationKind kind) noexcept {
        switch (kind) {
            case OperationKind::Create:
                return "create";
            case OperationKind::Update:
                return "update";
            case OperationKind::Upsert:
                return "upsert";
            case OperationKind::Delete:
                return "delete";
        }
        return "create";
    }

    std::string encode_batch_body(BatchRequest const& request) {
        json records = json::array();
        for (auto const& r : request.records) {
            json item = {{"id", r.id}};
            if (!r.payload.empty()) {
                auto payload = json::parse(r.payload, nullptr, false);
                item["payload"] =
                    payload.is_discarded() ? json(r.payload) : std::move(payload);
            }
            records.push_back(std::move(item));
        }
        return json{{"records", std::move(records)}}.dump();
    }

    BatchOutcome interpret_batch_response(
        int status, std::string_view body,
        std::optional<std::string_view> retry_after,
        std::size_t record_count) {
        if (status == 429 || status == 503) {
            return BatchThrottled{parse_retry_after(retry_after),
                                  error_text(status, body)};
        }
        if (status == 401 || status == 403) {
            return BatchTransportFault{error_text(status, body), true};
        }
        if (status >= 500 || status < 200 || (status >= 300 && status < 400)) {
            return BatchTransportFault{error_text(status, body), false};
        }
        if (status >= 400) {
            // The whole batch was rejected as invalid
            return BatchPartiallyFailed{
                all_failed(record_count, error_text(status, body))};
        }

        if (body.empty()) return BatchSucceeded{};

        auto doc = json::parse(body.begin(), body.end(), nullptr, false);
        if (doc.is_discarded() || !doc.is_object()) {
            return BatchPartiallyFailed{
                all_failed(record_count, "Malformed batch response")};
        }
        auto results = doc.find("results");
        if (results == doc.end()) return BatchSucceeded{};
        if (!results->is_array()) {
            return BatchPartiallyFailed{
                all_failed(record_count, "Malformed batch response")};
        }

        std::vector<RecordOutcome> outcomes;
        outcomes.reserve(results->size());
        bool any_failed = results->size() < record_count;
        for (auto const& item : *results) {
            RecordOutcome o;
            if (!item.is_object()) {
                o.succeeded = false;
                o.error_message = "Malformed record result";
            } else {
                if (auto ok = item.find("success");
                    ok != item.end() && ok->is_boolean()) {
                    o.succeeded = ok->get<bool>();
                }
                if (auto created = item.find("created");
                    created != item.end() && created->is_boolean()) {
                    o.created = created->get<bool>();
                }
                if (auto err = item.find("error");
                    err != item.end() && err->is_string()) {
                    o.error_message = err->get<std::string>();
                }
            }
            any_failed = any_failed || !o.succeeded;
            outcomes.push_back(std::move(o));
        }

        if (any_failed) return BatchPartiallyFailed{std::move(outcomes)};
        return BatchSucceeded{std::move(outcomes)};
    }

    std::optional<std::string> extract_affinity_cookie(
        std::string_view set_cookie) {
        while (!set_cookie.empty() && set_cookie.front() == ' ')
            set_cookie.remove_prefix(1);
        auto end = set_cookie.find(';');
        auto pair = set_cookie.substr(0, end);
        auto eq = pair.find('=');
        if (eq == std::string_view::npos) return std::nullopt;
        if (pair.substr(0, eq) != kAffinityCookieName) return std::nullopt;
        if (eq + 1 == pair.size()) return std::nullopt;
        return std::string(pair);
    }

    // ---------------------------------------------------------------------
    // HttpSession
    // ---------------------------------------------------------------------

    HttpSession::HttpSession(boost::asio::any_io_executor ex,
                             boost::asio::ssl::context& ssl_ctx, ServiceUrl url,
                             std::string access_token,
                             HttpSessionOptions options)
        : ex_(std::move(ex)),
          ssl_ctx_(ssl_ctx),
          url_(std::move(url)),
          access_token_(std::move(access_token)),
          options_(std::move(options)) {}

    void HttpSession::close() noexcept {
        boost::system::error_code ec;
        if (auto* s = std::get_if<HttpStream>(&stream_)) {
            s->socket().shutdown(tcp::socket::shutdown_both, ec);
            s->socket().close(ec);
        } else if (auto* tls = std::get_if<HttpsStream>(&stream_)) {
            // No TLS shutdown, just close the underlying TCP socket
            beast::get_lowest_layer(*tls).socket().shutdown(
                tcp::socket::shutdown_both, ec);
            beast::get_lowest_layer(*tls).socket().close(ec);
        }
        stream_.emplace<std::monostate>();
    }

    bool HttpSession::is_open() const noexcept {
        if (auto const* s = std::get_if<HttpStream>(&stream_)) {
            return s->socket().is_open();
        }
        if (auto const* tls = std::get_if<HttpsStream>(&stream_)) {
            return beast::get_lowest_layer(*tls).socket().is_open();
        }
        return false;
    }

    boost::asio::awaitable<boost::system::error_code> HttpSession::connect() {
        boost::system::error_code ec;
        if (is_open()) co_return ec;
        close();

        tcp::resolver resolver(ex_);
        auto results = co_await resolver.async_resolve(
            url_.host, url_.port,
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) co_return ec;

        if (!url_.https) {
            auto& s = stream_.emplace<HttpStream>(ex_);
            s.expires_after(options_.request_timeout);
            co_await s.async_connect(
                results,
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec) close();
            co_return ec;
        }

        auto& s = stream_.emplace<HttpsStream>(ex_, ssl_ctx_);
        beast::get_lowest_layer(s).expires_after(options_.request_timeout);
        co_await beast::get_lowest_layer(s).async_connect(
            results, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            close();
            co_return ec;
        }

        if (!set_sni(s, url_.host, ec)) {
            close();
            co_return ec;
        }

        co_await s.async_handshake(
            boost::asio::ssl::stream_base::client,
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) close();
        co_return ec;
    }

    HttpSession::BeastRequest HttpSession::make_request_(
        http::verb verb, std::string target) const {
        BeastRequest req{verb, target, 11};
        req.set(http::field::host, url_.host_header());
        req.set(http::field::user_agent, options_.user_agent);
        req.set(http::field::accept, "application/json");
        if (!access_token_.empty()) {
            req.set(http::field::authorization, "Bearer " + access_token_);
        }
        req.keep_alive(true);
        return req;
    }

    boost::asio::awaitable<boost::system::error_code> HttpSession::round_trip_(
        BeastRequest& req, BeastResponse& res) {
        auto ec = co_await connect();
        if (ec) co_return ec;

        buffer_.clear();
        if (auto* s = std::get_if<HttpStream>(&stream_)) {
            s->expires_after(options_.request_timeout);
            co_await http::async_write(
                *s, req,
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (!ec) {
                s->expires_after(options_.request_timeout);
                co_await http::async_read(
                    *s, buffer_, res,
                    boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            }
        } else {
            auto& tls = std::get<HttpsStream>(stream_);
            beast::get_lowest_layer(tls).expires_after(options_.request_timeout);
            co_await http::async_write(
                tls, req,
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (!ec) {
                beast::get_lowest_layer(tls).expires_after(
                    options_.request_timeout);
                co_await http::async_read(
                    tls, buffer_, res,
                    boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            }
        }

        if (ec || !res.keep_alive()) close();
        co_return ec;
    }

    boost::asio::awaitable<BatchResponse> HttpSession::execute_batch(
        BatchRequest const& request) {
        auto req = make_request_(
            http::verb::post,
            url_.target("/" + request.entity + "/$batch?operation=" +
                        operation_query_value(request.kind)));
        req.set(http::field::content_type, "application/json");
        if (request.affinity_token) {
            req.set(http::field::cookie, *request.affinity_token);
        }
        req.body() = encode_batch_body(request);
        req.prepare_payload();

        BeastResponse res;
        auto ec = co_await round_trip_(req, res);
        if (ec) {
            spdlog::debug("Batch call to {} failed: {}", url_.host, ec.message());
            co_return BatchResponse{BatchTransportFault{ec.message(), false},
                                    std::nullopt};
        }

        std::optional<std::string_view> retry_after;
        if (auto it = res.find(http::field::retry_after); it != res.end()) {
            retry_after = to_std(it->value());
        }

        BatchResponse out;
        out.outcome =
            interpret_batch_response(static_cast<int>(res.result_int()),
                                     res.body(), retry_after,
                                     request.records.size());

        auto cookies = res.equal_range(http::field::set_cookie);
        for (auto it = cookies.first; it != cookies.second; ++it) {
            if (auto token = extract_affinity_cookie(to_std(it->value()))) {
                out.affinity_token = std::move(token);
            }
        }
        co_return out;
    }

    boost::asio::awaitable<Result<std::size_t>>
    HttpSession::recommended_parallelism() {
        auto req = make_request_(http::verb::get, url_.target("/"));
        BeastResponse res;
        auto ec = co_await round_trip_(req, res);
        if (ec) {
            co_return Result<std::size_t>::err(Error::Code::TransportFault,
                                               ec.message());
        }
        if (res.result_int() != 200) {
            co_return Result<std::size_t>::err(
                Error::Code::TransportFault,
                error_text(static_cast<int>(res.result_int()), res.body()));
        }

        auto it = res.find(beast::string_view(kParallelismHintHeader.data(),
                                              kParallelismHintHeader.size()));
        if (it == res.end()) {
            co_return Result<std::size_t>::err(
                Error::Code::Unknown,
                "Service response has no " +
                    std::string(kParallelismHintHeader) + " header");
        }

        auto raw = to_std(it->value());
        std::size_t hint = 0;
        auto [ptr, parse_ec] =
            std::from_chars(raw.data(), raw.data() + raw.size(), hint);
        if (parse_ec != std::errc{} || ptr != raw.data() + raw.size()) {
            co_return Result<std::size_t>::err(
                Error::Code::Unknown,
                "Malformed " + std::string(kParallelismHintHeader) +
                    " header: '" + std::string(raw) + "'");
        }
        co_return Result<std::size_t>::ok(hint);
    }

    // ---------------------------------------------------------------------
    // HttpSessionFactory
    // ---------------------------------------------------------------------

    HttpSessionFactory::HttpSessionFactory(boost::asio::any_io_executor ex,
                                           std::string service_url,
                                           HttpSessionOptions options)
        : ex_(std::move(ex)),
          service_url_(std::move(service_url)),
          options_(std::move(options)),
          ssl_ctx_(boost::asio::ssl::context::tls_client) {
        init_tls_on_ssl_context(ssl_ctx_, options_.verify_tls);
    }

    boost::asio::awaitable<Result<std::unique_ptr<RemoteSession>>>
    HttpSessionFactory::create_session(ConnectionSource const& source) {
        using R = Result<std::unique_ptr<RemoteSession>>;

        auto url = parse_service_url(service_url_);
        if (url.has_error()) {
            co_return R::err(Error::Code::ConnectionCreationFailed,
                             url.error().message);
        }
        if (source.access_token.empty()) {
            co_return R::err(Error::Code::ConnectionCreationFailed,
                             "Connection source '" + source.name +
                                 "' has no access token");
        }

        auto session = std::make_unique<HttpSession>(
            ex_, ssl_ctx_, std::move(url).value(), source.access_token,
            options_);
        auto ec = co_await session->connect();
        if (ec) {
            co_return R::err(Error::Code::ConnectionCreationFailed,
                             "Cannot connect to " + service_url_ + ": " +
                                 ec.message());
        }
        co_return R::ok(std::move(session));
    }

}  // namespace bulk_cpp
