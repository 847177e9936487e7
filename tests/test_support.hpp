#pragma once

#include <atomic>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

namespace bulk_cpp::test {

    namespace net = boost::asio;

    // ---------------------
    // Hard watchdog (non-Asio)
    // ---------------------
    struct HardWatchdog {
        explicit HardWatchdog(std::chrono::milliseconds timeout)
            : timeout_(timeout), start_(std::chrono::steady_clock::now()) {
            thread_ = std::thread([this] {
                for (;;) {
                    if (done_.load(std::memory_order_relaxed)) return;
                    auto now = std::chrono::steady_clock::now();
                    if (now - start_ >= timeout_) {
                        std::fprintf(
                            stderr,
                            "\n[ WATCHDOG ] test exceeded %lld ms; aborting "
                            "(deadlock or lost wake-up)\n",
                            (long long)timeout_.count());
                        std::fflush(stderr);
                        std::abort();
                    }
                    std::this_thread::sleep_for(std::chrono::milliseconds(10));
                }
            });
        }

        ~HardWatchdog() {
            done_.store(true, std::memory_order_relaxed);
            if (thread_.joinable()) thread_.join();
        }

       private:
        std::chrono::milliseconds timeout_;
        std::chrono::steady_clock::time_point start_;
        std::atomic<bool> done_{false};
        std::thread thread_;
    };

    // ---------------------
    // IO runner
    // ---------------------
    struct IoThreadRunner {
        explicit IoThreadRunner(int threads = 1) : ioc_(threads), threads_(threads) {
            start();
        }

        void start() {
            guard_.emplace(net::make_work_guard(ioc_));
            for (int i = 0; i < threads_; ++i) {
                workers_.emplace_back([this] { ioc_.run(); });
            }
        }

        void stop() {
            if (guard_) guard_.reset();
            ioc_.stop();
            for (auto& t : workers_) {
                if (t.joinable()) t.join();
            }
            workers_.clear();
        }

        ~IoThreadRunner() { stop(); }

        net::io_context& ioc() { return ioc_; }

        net::any_io_executor executor() { return ioc_.get_executor(); }

       private:
        net::io_context ioc_;
        int threads_;
        std::optional<net::executor_work_guard<net::io_context::executor_type>>
            guard_;
        std::vector<std::thread> workers_;
    };

    /// @brief Run @p aw on @p ioc and block until it completes; abort the
    /// process if it hangs.
    template <class T>
    T await_or_abort(net::io_context& ioc, net::awaitable<T> aw,
                     std::chrono::milliseconds timeout =
                         std::chrono::milliseconds(10000)) {
        HardWatchdog wd(timeout + std::chrono::milliseconds(1500));

        auto prom = std::make_shared<std::promise<T>>();
        auto fut = prom->get_future();

        net::co_spawn(
            ioc,
            [aw = std::move(aw), prom]() mutable -> net::awaitable<void> {
                try {
                    T v = co_await std::move(aw);
                    prom->set_value(std::move(v));
                } catch (...) {
                    prom->set_exception(std::current_exception());
                }
                co_return;
            },
            net::detached);

        if (fut.wait_for(timeout) != std::future_status::ready) {
            ADD_FAILURE()
                << "Async operation timed out after " << timeout.count()
                << "ms (lost wake-up or pool deadlock).";
            std::abort();
        }

        return fut.get();
    }

}  // namespace bulk_cpp::test
