#include <gtest/gtest.h>

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

#include "bulk_cpp/bulk/bulk_operation_executor.hpp"
#include "bulk_cpp/connection/connection_pool.hpp"
#include "bulk_cpp/http/http_session.hpp"
#include "bulk_cpp/http/service_url.hpp"
#include "fake_remote.hpp"
#include "test_support.hpp"

using namespace bulk_cpp;
using namespace std::chrono_literals;

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

namespace {

    using ServerRequest = http::request<http::string_body>;
    using ServerResponse = http::response<http::string_body>;

    /// @brief Blocking HTTP/1.1 server on 127.0.0.1 with a scripted handler.
    class LocalBatchServer {
       public:
        using Handler = std::function<void(ServerRequest const&, ServerResponse&)>;

        LocalBatchServer() : ioc_(1), acceptor_(ioc_) {}

        void start() {
            boost::system::error_code ec;
            tcp::endpoint ep{net::ip::make_address("127.0.0.1"), 0};

            acceptor_.open(ep.protocol(), ec);
            if (ec) throw std::runtime_error("acceptor.open: " + ec.message());
            acceptor_.set_option(net::socket_base::reuse_address(true), ec);
            if (ec)
                throw std::runtime_error("acceptor.set_option: " + ec.message());
            acceptor_.bind(ep, ec);
            if (ec) throw std::runtime_error("acceptor.bind: " + ec.message());
            acceptor_.listen(net::socket_base::max_listen_connections, ec);
            if (ec) throw std::runtime_error("acceptor.listen: " + ec.message());

            port_ = acceptor_.local_endpoint().port();
            do_accept();
            thread_ = std::thread([this] { ioc_.run(); });
        }

        void stop() {
            bool expected = false;
            if (!stopped_.compare_exchange_strong(expected, true)) return;
            boost::system::error_code ec;
            acceptor_.close(ec);
            ioc_.stop();
            if (thread_.joinable()) thread_.join();
        }

        ~LocalBatchServer() { stop(); }

        std::string url(std::string const& path = "/api/data") const {
            return "http://127.0.0.1:" + std::to_string(port_) + path;
        }

        void set_handler(Handler h) {
            std::lock_guard<std::mutex> lk(mu_);
            handler_ = std::move(h);
            requests_.clear();
        }

        std::vector<ServerRequest> requests() const {
            std::lock_guard<std::mutex> lk(mu_);
            return requests_;
        }

        std::size_t connections() const { return connections_.load(); }

       private:
        void do_accept() {
            acceptor_.async_accept(
                net::make_strand(ioc_),
                [this](boost::system::error_code ec, tcp::socket sock) {
                    if (!ec) {
                        connections_.fetch_add(1);
                        std::thread(&LocalBatchServer::handle_connection, this,
                                    std::move(sock))
                            .detach();
                    }
                    if (!stopped_.load(std::memory_order_relaxed)) {
                        do_accept();
                    }
                });
        }

        void handle_connection(tcp::socket sock) {
            beast::tcp_stream stream(std::move(sock));
            beast::flat_buffer buffer;

            for (;;) {
                boost::system::error_code ec;
                ServerRequest req;
                http::read(stream, buffer, req, ec);
                if (ec) break;

                ServerResponse res;
                res.version(req.version());
                res.keep_alive(req.keep_alive());
                res.result(http::status::ok);
                {
                    std::lock_guard<std::mutex> lk(mu_);
                    requests_.push_back(req);
                    if (handler_) handler_(req, res);
                }
                res.prepare_payload();

                http::write(stream, res, ec);
                if (ec || !res.keep_alive()) break;
            }

            boost::system::error_code ignored;
            stream.socket().shutdown(tcp::socket::shutdown_send, ignored);
        }

        net::io_context ioc_;
        tcp::acceptor acceptor_;
        std::thread thread_;
        std::atomic<bool> stopped_{false};
        std::atomic<std::size_t> connections_{0};
        unsigned short port_{0};

        mutable std::mutex mu_;
        Handler handler_;
        std::vector<ServerRequest> requests_;
    };

    std::string header(ServerRequest const& req, http::field f) {
        auto it = req.find(f);
        return it == req.end() ? std::string{} : std::string(it->value());
    }

    // ---------------------------------------------------------------------
    // Pure helpers
    // ---------------------------------------------------------------------

    TEST(ServiceUrlTest, ParsesSchemeHostPortAndPath) {
        auto r = parse_service_url("https://Org.Example.com/api/data/v9.2/");
        ASSERT_TRUE(r.has_value());
        auto const& u = r.value();
        EXPECT_TRUE(u.https);
        EXPECT_EQ(u.host, "org.example.com");
        EXPECT_EQ(u.port, "443");
        EXPECT_EQ(u.base_path, "/api/data/v9.2");
        EXPECT_EQ(u.target("/account/$batch"), "/api/data/v9.2/account/$batch");
        EXPECT_EQ(u.host_header(), "org.example.com");

        auto local = parse_service_url("http://127.0.0.1:8080");
        ASSERT_TRUE(local.has_value());
        EXPECT_FALSE(local.value().https);
        EXPECT_EQ(local.value().port, "8080");
        EXPECT_EQ(local.value().target("/"), "/");
        EXPECT_EQ(local.value().host_header(), "127.0.0.1:8080");
    }

    TEST(ServiceUrlTest, RejectsBadUrls) {
        for (auto bad : {"org.example.com/api", "ftp://x/", "https://",
                         "https://host:/api", "https://host/api?x=1"}) {
            auto r = parse_service_url(bad);
            ASSERT_TRUE(r.has_error()) << bad;
            EXPECT_EQ(r.error().code, Error::Code::InvalidUrl) << bad;
        }
    }

    TEST(BatchCodecTest, OperationQueryValues) {
        EXPECT_STREQ(operation_query_value(OperationKind::Create), "create");
        EXPECT_STREQ(operation_query_value(OperationKind::Update), "update");
        EXPECT_STREQ(operation_query_value(OperationKind::Upsert), "upsert");
        EXPECT_STREQ(operation_query_value(OperationKind::Delete), "delete");
    }

    TEST(BatchCodecTest, EncodeEmbedsJsonPayloads) {
        BatchRequest req;
        req.records = {Record{"a", R"({"name":"Contoso"})"},
                       Record{"b", "not json"}, Record{"c", ""}};
        auto doc = nlohmann::json::parse(encode_batch_body(req));

        auto const& records = doc.at("records");
        ASSERT_EQ(records.size(), 3u);
        EXPECT_EQ(records[0].at("id"), "a");
        EXPECT_EQ(records[0].at("payload").at("name"), "Contoso");
        EXPECT_EQ(records[1].at("payload"), "not json");
        EXPECT_FALSE(records[2].contains("payload"));
    }

    TEST(BatchCodecTest, ThrottleStatuses) {
        auto o = interpret_batch_response(429, "", std::string_view("7"), 3);
        auto const* t = std::get_if<BatchThrottled>(&o);
        ASSERT_NE(t, nullptr);
        ASSERT_TRUE(t->retry_after.has_value());
        EXPECT_EQ(*t->retry_after, 7000ms);

        auto busy = interpret_batch_response(503, "", std::nullopt, 3);
        ASSERT_TRUE(std::holds_alternative<BatchThrottled>(busy));
        EXPECT_FALSE(std::get<BatchThrottled>(busy).retry_after.has_value());

        // HTTP-date values are not understood
        auto dated = interpret_batch_response(
            429, "", std::string_view("Wed, 21 Oct 2015 07:28:00 GMT"), 3);
        EXPECT_FALSE(std::get<BatchThrottled>(dated).retry_after.has_value());

        auto huge = interpret_batch_response(
            429, "", std::string_view("9223372036854775807"), 3);
        ASSERT_TRUE(std::get<BatchThrottled>(huge).retry_after.has_value());
        EXPECT_EQ(*std::get<BatchThrottled>(huge).retry_after, max_retry_after);
    }

    TEST(BatchCodecTest, TransportStatuses) {
        auto auth = interpret_batch_response(401, "", std::nullopt, 1);
        ASSERT_TRUE(std::holds_alternative<BatchTransportFault>(auth));
        EXPECT_TRUE(std::get<BatchTransportFault>(auth).authentication);

        auto server = interpret_batch_response(
            500, R"({"error":{"message":"worker crashed"}})", std::nullopt, 1);
        ASSERT_TRUE(std::holds_alternative<BatchTransportFault>(server));
        EXPECT_FALSE(std::get<BatchTransportFault>(server).authentication);
        EXPECT_EQ(std::get<BatchTransportFault>(server).message,
                  "worker crashed");
    }

    TEST(BatchCodecTest, ClientErrorFailsEveryRecord) {
        auto o = interpret_batch_response(400, R"({"error":"bad entity"})",
                                          std::nullopt, 4);
        auto const* p = std::get_if<BatchPartiallyFailed>(&o);
        ASSERT_NE(p, nullptr);
        ASSERT_EQ(p->records.size(), 4u);
        for (auto const& r : p->records) {
            EXPECT_FALSE(r.succeeded);
            EXPECT_EQ(r.error_message, "bad entity");
        }
    }

    TEST(BatchCodecTest, SuccessBodies) {
        EXPECT_TRUE(std::holds_alternative<BatchSucceeded>(
            interpret_batch_response(204, "", std::nullopt, 5)));
        EXPECT_TRUE(std::holds_alternative<BatchSucceeded>(
            interpret_batch_response(200, R"({"count":5})", std::nullopt, 5)));

        auto o = interpret_batch_response(
            200,
            R"({"results":[{"success":true,"created":true},{"success":true,"created":false}]})",
            std::nullopt, 2);
        auto const* s = std::get_if<BatchSucceeded>(&o);
        ASSERT_NE(s, nullptr);
        ASSERT_EQ(s->records.size(), 2u);
        EXPECT_EQ(s->records[0].created, std::optional<bool>(true));
        EXPECT_EQ(s->records[1].created, std::optional<bool>(false));
    }

    TEST(BatchCodecTest, PerRecordFailures) {
        auto o = interpret_batch_response(
            200,
            R"({"results":[{"success":true},{"success":false,"error":"duplicate key"}]})",
            std::nullopt, 3);
        auto const* p = std::get_if<BatchPartiallyFailed>(&o);
        ASSERT_NE(p, nullptr);
        // The third record got no result at all
        ASSERT_EQ(p->records.size(), 2u);
        EXPECT_TRUE(p->records[0].succeeded);
        EXPECT_FALSE(p->records[1].succeeded);
        EXPECT_EQ(p->records[1].error_message, "duplicate key");
    }

    TEST(BatchCodecTest, MalformedSuccessBody) {
        for (auto body : {"<html>", R"({"results":5})", "[1,2]"}) {
            auto o = interpret_batch_response(200, body, std::nullopt, 2);
            auto const* p = std::get_if<BatchPartiallyFailed>(&o);
            ASSERT_NE(p, nullptr) << body;
            ASSERT_EQ(p->records.size(), 2u);
            EXPECT_EQ(p->records[0].error_message, "Malformed batch response");
        }
    }

    TEST(BatchCodecTest, AffinityCookie) {
        EXPECT_EQ(extract_affinity_cookie("ARRAffinity=abc123; Path=/; HttpOnly"),
                  std::optional<std::string>("ARRAffinity=abc123"));
        EXPECT_EQ(extract_affinity_cookie(" ARRAffinity=x"),
                  std::optional<std::string>("ARRAffinity=x"));
        EXPECT_FALSE(extract_affinity_cookie("session=abc; Path=/").has_value());
        EXPECT_FALSE(extract_affinity_cookie("ARRAffinity=; Path=/").has_value());
        EXPECT_FALSE(extract_affinity_cookie("ARRAffinity").has_value());
    }

    // ---------------------------------------------------------------------
    // Against a local server
    // ---------------------------------------------------------------------

    class HttpSessionTest : public ::testing::Test {
       protected:
        static void SetUpTestSuite() { server_.start(); }

        static void TearDownTestSuite() { server_.stop(); }

        std::unique_ptr<RemoteSession> make_session(
            std::string token = "token-1") {
            ConnectionSource src{"primary", "app", "secret", std::move(token)};
            auto r = test::await_or_abort(runner.ioc(),
                                          factory.create_session(src));
            EXPECT_TRUE(r.has_value())
                << (r.has_error() ? r.error().message : std::string{});
            if (r.has_error()) return nullptr;
            return std::move(r).value();
        }

        static inline LocalBatchServer server_{};
        test::IoThreadRunner runner{1};
        // Sessions keep a reference to the factory's TLS context
        HttpSessionFactory factory{runner.executor(), server_.url()};
    };

    TEST_F(HttpSessionTest, ExecuteBatchSendsRequestAndMapsResults) {
        server_.set_handler([](ServerRequest const&, ServerResponse& res) {
            res.set(http::field::content_type, "application/json");
            res.set(http::field::set_cookie,
                    "ARRAffinity=node-3; Path=/; HttpOnly");
            res.body() =
                R"({"results":[{"success":true,"created":true},{"success":false,"error":"name too long"}]})";
        });
        auto session = make_session();
        ASSERT_NE(session, nullptr);

        BatchRequest req;
        req.entity = "account";
        req.kind = OperationKind::Upsert;
        req.records = {Record{"1", R"({"name":"a"})"},
                       Record{"2", R"({"name":"b"})"}};
        req.affinity_token = "ARRAffinity=node-1";

        auto resp = test::await_or_abort(runner.ioc(),
                                         session->execute_batch(req));
        auto const* p = std::get_if<BatchPartiallyFailed>(&resp.outcome);
        ASSERT_NE(p, nullptr);
        ASSERT_EQ(p->records.size(), 2u);
        EXPECT_EQ(p->records[0].created, std::optional<bool>(true));
        EXPECT_EQ(p->records[1].error_message, "name too long");
        EXPECT_EQ(resp.affinity_token,
                  std::optional<std::string>("ARRAffinity=node-3"));

        auto reqs = server_.requests();
        ASSERT_EQ(reqs.size(), 1u);
        auto const& seen = reqs[0];
        EXPECT_EQ(seen.method(), http::verb::post);
        EXPECT_EQ(std::string(seen.target()),
                  "/api/data/account/$batch?operation=upsert");
        EXPECT_EQ(header(seen, http::field::authorization), "Bearer token-1");
        EXPECT_EQ(header(seen, http::field::cookie), "ARRAffinity=node-1");
        EXPECT_EQ(header(seen, http::field::content_type), "application/json");
        auto body = nlohmann::json::parse(seen.body());
        EXPECT_EQ(body.at("records").size(), 2u);
        EXPECT_EQ(body.at("records")[1].at("payload").at("name"), "b");
    }

    TEST_F(HttpSessionTest, KeepAliveReusesSocket) {
        server_.set_handler([](ServerRequest const&, ServerResponse&) {});
        auto before = server_.connections();
        auto session = make_session();
        ASSERT_NE(session, nullptr);

        BatchRequest req;
        req.entity = "contact";
        req.records = {Record{"1", "{}"}};
        for (int i = 0; i < 3; ++i) {
            auto resp = test::await_or_abort(runner.ioc(),
                                             session->execute_batch(req));
            EXPECT_TRUE(std::holds_alternative<BatchSucceeded>(resp.outcome));
        }
        EXPECT_EQ(server_.requests().size(), 3u);
        EXPECT_EQ(server_.connections() - before, 1u);
    }

    TEST_F(HttpSessionTest, ThrottleResponse) {
        server_.set_handler([](ServerRequest const&, ServerResponse& res) {
            res.result(http::status::too_many_requests);
            res.set(http::field::retry_after, "3");
            res.body() = R"({"error":{"message":"Rate limit exceeded"}})";
        });
        auto session = make_session();
        ASSERT_NE(session, nullptr);

        BatchRequest req;
        req.entity = "account";
        req.records = {Record{"1", "{}"}};
        auto resp = test::await_or_abort(runner.ioc(),
                                         session->execute_batch(req));
        auto const* t = std::get_if<BatchThrottled>(&resp.outcome);
        ASSERT_NE(t, nullptr);
        EXPECT_EQ(t->retry_after, std::optional<std::chrono::milliseconds>(3000ms));
        EXPECT_EQ(t->message, "Rate limit exceeded");
    }

    TEST_F(HttpSessionTest, RecommendedParallelismFromHeader) {
        server_.set_handler([](ServerRequest const&, ServerResponse& res) {
            res.set(std::string(kParallelismHintHeader), "7");
        });
        auto session = make_session();
        ASSERT_NE(session, nullptr);

        auto r = test::await_or_abort(runner.ioc(),
                                      session->recommended_parallelism());
        ASSERT_TRUE(r.has_value()) << r.error().message;
        EXPECT_EQ(r.value(), 7u);

        auto reqs = server_.requests();
        ASSERT_EQ(reqs.size(), 1u);
        EXPECT_EQ(reqs[0].method(), http::verb::get);
        EXPECT_EQ(std::string(reqs[0].target()), "/api/data/");
    }

    TEST_F(HttpSessionTest, MissingParallelismHeaderIsAnError) {
        server_.set_handler([](ServerRequest const&, ServerResponse&) {});
        auto session = make_session();
        ASSERT_NE(session, nullptr);

        auto r = test::await_or_abort(runner.ioc(),
                                      session->recommended_parallelism());
        ASSERT_TRUE(r.has_error());
        // The connection itself is still usable
        EXPECT_EQ(r.error().code, Error::Code::Unknown);
    }

    TEST_F(HttpSessionTest, FactoryRejectsUnusableSources) {
        ConnectionSource no_token{"primary", "app", "secret", ""};
        auto r1 = test::await_or_abort(runner.ioc(),
                                       factory.create_session(no_token));
        ASSERT_TRUE(r1.has_error());
        EXPECT_EQ(r1.error().code, Error::Code::ConnectionCreationFailed);

        HttpSessionFactory bad_url(runner.executor(), "not a url");
        ConnectionSource src{"primary", "app", "secret", "token"};
        auto r2 = test::await_or_abort(runner.ioc(),
                                       bad_url.create_session(src));
        ASSERT_TRUE(r2.has_error());
        EXPECT_EQ(r2.error().code, Error::Code::ConnectionCreationFailed);
    }

    TEST_F(HttpSessionTest, BulkOperationAgainstServer) {
        std::atomic<int> batches{0};
        server_.set_handler([&](ServerRequest const& req, ServerResponse& res) {
            if (req.method() == http::verb::get) {
                res.set(std::string(kParallelismHintHeader), "2");
                return;
            }
            ++batches;
            auto doc = nlohmann::json::parse(req.body());
            nlohmann::json results = nlohmann::json::array();
            for (auto const& rec : doc.at("records")) {
                results.push_back({{"success", rec.at("id") != "rec-17"},
                                   {"error", "rejected"}});
            }
            res.body() = nlohmann::json{{"results", results}}.dump();
        });

        auto shared_factory =
            std::make_shared<HttpSessionFactory>(runner.executor(), server_.url());
        auto pool = std::make_shared<ConnectionPool>(
            runner.executor(), shared_factory, test::one_source(),
            ConnectionPoolConfiguration{});
        BulkOperationConfiguration cfg;
        cfg.default_batch_size = 10;
        BulkOperationExecutor exec(pool, cfg);

        auto r = test::await_or_abort(
            runner.ioc(),
            exec.create_multiple("account", test::make_records(30)));
        ASSERT_TRUE(r.has_value());
        EXPECT_EQ(r.value().success_count, 29u);
        ASSERT_EQ(r.value().failures.size(), 1u);
        EXPECT_EQ(r.value().failures[0].record_id, "rec-17");
        EXPECT_EQ(r.value().failures[0].message, "rejected");
        EXPECT_EQ(batches.load(), 3);
        EXPECT_EQ(pool->effective_capacity(), 2u);

        pool->shutdown();
        server_.set_handler(nullptr);
    }

}  // namespace
