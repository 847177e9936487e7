#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

#include "bulk_cpp/bulk/bulk_operation_executor.hpp"
#include "bulk_cpp/connection/connection_pool.hpp"
#include "fake_remote.hpp"
#include "test_support.hpp"

using namespace bulk_cpp;
using namespace std::chrono_literals;

static void print_result(const char* label, BulkOperationResult const& r) {
    const double secs =
        std::chrono::duration<double>(r.elapsed).count();
    const double rps = secs > 0 ? (double)r.total_count / secs : 0.0;

    std::cout << "\n[ PERF ] " << label << "\n"
              << "        records=" << r.total_count
              << " batches=" << r.batches_total
              << " elapsed_ms=" << r.elapsed.count()
              << " records_per_s=" << std::fixed << std::setprecision(2) << rps
              << " throttles=" << r.throttle_events
              << " budget=" << r.rate.budget
              << " lowest_budget=" << r.rate.lowest_budget << "\n";
}

class BulkExecutorPerf : public ::testing::Test {
   protected:
    static void SetUpTestSuite() { spdlog::set_level(spdlog::level::warn); }

    std::shared_ptr<ConnectionPool> make_pool() {
        return std::make_shared<ConnectionPool>(
            runner.executor(), factory, test::one_source(),
            ConnectionPoolConfiguration{});
    }

    std::shared_ptr<test::FakeService> svc =
        std::make_shared<test::FakeService>();
    std::shared_ptr<test::FakeSessionFactory> factory =
        std::make_shared<test::FakeSessionFactory>(svc);
    test::IoThreadRunner runner{4};
};

TEST_F(BulkExecutorPerf, PresetsAgainst5msService) {
    svc->latency = 5ms;
    svc->parallelism_hint = 52;

    for (auto preset : {RatePreset::Conservative, RatePreset::Balanced,
                        RatePreset::Aggressive}) {
        auto pool = make_pool();
        BulkOperationExecutor exec(pool);

        BulkOperationOptions options;
        options.rate_preset = preset;
        options.batch_size = 100;
        auto r = test::await_or_abort(
            runner.ioc(),
            exec.create_multiple("account", test::make_records(20000), options),
            std::chrono::milliseconds(60000));
        ASSERT_TRUE(r.has_value());
        ASSERT_TRUE(r.value().all_succeeded());

        std::string label = std::string("20k records, 5ms service, preset ") +
                            to_string(preset);
        print_result(label.c_str(), r.value());
    }
}

TEST_F(BulkExecutorPerf, ThrottleStormRecovery) {
    // Every fourth call is throttled for a short while
    std::atomic<std::uint64_t> calls{0};
    svc->latency = 2ms;
    svc->parallelism_hint = 52;
    svc->handler = [&calls](BatchRequest const&, std::size_t) {
        return calls.fetch_add(1) % 4 == 3 ? test::throttled(5ms)
                                           : test::succeeded();
    };

    auto pool = make_pool();
    BulkOperationConfiguration cfg;
    cfg.throttle_backoff_base = 5ms;
    cfg.throttle_backoff_max = 50ms;
    cfg.max_throttle_retries = 20;
    BulkOperationExecutor exec(pool, cfg);

    BulkOperationOptions options;
    options.rate_preset = RatePreset::Aggressive;
    options.batch_size = 50;
    auto r = test::await_or_abort(
        runner.ioc(),
        exec.upsert_multiple("contact", test::make_records(10000), options),
        std::chrono::milliseconds(60000));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value().success_count + r.value().failed_count, 10000u);

    print_result("10k records, every 4th call throttled (Aggressive)",
                 r.value());
}
