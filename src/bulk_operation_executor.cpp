#include "bulk_cpp/bulk/bulk_operation_executor.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <cstddef>
#include <deque>
#include <exception>
#include <limits>
#include <mutex>
#include <optional>
#include <variant>

namespace bulk_cpp {

    namespace {
        using clock_type = std::chrono::steady_clock;

        // Longest the dispatcher sleeps without a wake-up
        constexpr std::chrono::milliseconds kDispatchSlice{50};

        enum class BatchState : std::uint8_t {
            Pending,  ///< Not admitted yet
            Running,  ///< Admitted, coroutine alive
            Backoff,  ///< Throttled, waiting for its retry instant
            Done,     ///< Every record accounted for
        };

        std::chrono::milliseconds throttle_backoff(
            std::size_t attempt, std::chrono::milliseconds base,
            std::chrono::milliseconds max) {
            auto delay = base;
            for (std::size_t i = 1; i < attempt && delay < max; ++i) {
                delay *= 2;
            }
            return std::min(delay, max);
        }
    }  // namespace

    /// @brief Shared state of one submit() call.
    struct BulkOperationExecutor::Operation {
        struct Batch {
            std::size_t first{0};
            std::size_t count{0};
            BatchState state{BatchState::Pending};
            std::size_t throttle_attempts{0};
            clock_type::time_point ready_at{};
        };

        std::shared_ptr<ConnectionPool> pool;
        std::string entity;
        OperationKind kind{OperationKind::Create};
        std::vector<Record> records;  ///< Immutable once batches start
        std::shared_ptr<RateController> rate;
        CancellationToken token;

        bool continue_on_error{true};
        bool drain_on_stop{true};
        std::size_t max_parallel{std::numeric_limits<std::size_t>::max()};
        std::size_t max_throttle_retries{0};
        std::chrono::milliseconds backoff_base{0};
        std::chrono::milliseconds backoff_max{0};
        std::size_t transport_retry_count{0};

        std::mutex mu;
        std::vector<Batch> batches;
        std::size_t next_batch{0};
        std::deque<std::size_t> backoff;
        std::size_t in_flight{0};
        bool stop{false};
        bool cancelled{false};
        bool wake_pending{false};
        std::shared_ptr<boost::asio::steady_timer> timer;
        BulkOperationResult result;

        /// @brief Make the dispatcher re-evaluate admission.
        void wake() {
            std::lock_guard<std::mutex> lk(mu);
            wake_pending = true;
            if (timer) timer->cancel();
        }

        /// @brief Fail every record of batch @p b.
        void fail_locked(std::size_t b, FailureKind kind,
                         std::string const& message) {
            auto& batch = batches[b];
            if (batch.state == BatchState::Done) return;
            for (std::size_t i = batch.first; i < batch.first + batch.count;
                 ++i) {
                result.failures.push_back(
                    RecordFailure{i, records[i].id, kind, message});
                ++result.failed_count;
            }
            batch.state = BatchState::Done;
        }

        /// @brief Account a batch call that reached the service.
        /// @param missing_succeeded How records without a reported outcome
        /// count.
        void settle_locked(std::size_t b,
                           std::vector<RecordOutcome> const& outcomes,
                           bool missing_succeeded) {
            auto& batch = batches[b];
            if (batch.state == BatchState::Done) return;

            bool any_failed = false;
            for (std::size_t j = 0; j < batch.count; ++j) {
                const std::size_t i = batch.first + j;
                if (j < outcomes.size()) {
                    auto const& o = outcomes[j];
                    if (o.succeeded) {
                        ++result.success_count;
                        if (o.created) {
                            if (*o.created)
                                ++result.created_count;
                            else
                                ++result.updated_count;
                        }
                        continue;
                    }
                    result.failures.push_back(RecordFailure{
                        i, records[i].id, FailureKind::RecordValidationFailure,
                        o.error_message.empty() ? "Record rejected by service"
                                                : o.error_message});
                } else if (missing_succeeded) {
                    ++result.success_count;
                    continue;
                } else {
                    result.failures.push_back(RecordFailure{
                        i, records[i].id, FailureKind::RecordValidationFailure,
                        "No outcome reported for record"});
                }
                ++result.failed_count;
                any_failed = true;
            }
            batch.state = BatchState::Done;
            if (any_failed) note_failure_locked();
        }

        /// @brief Stop admission on the first failure unless continuing.
        void note_failure_locked() {
            if (continue_on_error || stop) return;
            stop = true;
            result.stopped_on_error = true;
        }
    };

    BulkOperationExecutor::BulkOperationExecutor(
        std::shared_ptr<ConnectionPool> pool, BulkOperationConfiguration cfg)
        : pool_(std::move(pool)), cfg_(std::move(cfg)) {}

    boost::asio::awaitable<Result<BulkOperationResult>>
    BulkOperationExecutor::submit(std::string entity,
                                  std::vector<Record> records,
                                  OperationKind kind,
                                  BulkOperationOptions options,
                                  CancellationToken token) {
        using R = Result<BulkOperationResult>;

        const std::size_t batch_size =
            options.batch_size.value_or(cfg_.default_batch_size);
        if (batch_size < 1) {
            co_return R::err(Error::Code::InvalidArgument,
                             "batch_size must be at least 1");
        }
        std::optional<std::size_t> max_parallel =
            options.max_parallel_batches ? options.max_parallel_batches
                                         : cfg_.max_parallel_batches;
        if (max_parallel && *max_parallel < 1) {
            co_return R::err(Error::Code::InvalidArgument,
                             "max_parallel_batches must be at least 1");
        }
        if (!pool_ || !pool_->is_enabled()) {
            spdlog::error("{} of {} record(s) on '{}' refused: pool unavailable",
                          to_string(kind), records.size(), entity);
            co_return R::err(
                Error::Code::PoolUnavailable,
                "Connection pool is disabled or has no connection sources");
        }

        auto op = std::make_shared<Operation>();
        op->pool = pool_;
        op->entity = std::move(entity);
        op->kind = kind;
        op->records = std::move(records);
        op->token = token;
        op->continue_on_error = options.continue_on_error;
        op->drain_on_stop = options.drain_on_stop;
        if (max_parallel) op->max_parallel = *max_parallel;
        op->max_throttle_retries = cfg_.max_throttle_retries;
        op->backoff_base = cfg_.throttle_backoff_base;
        op->backoff_max = cfg_.throttle_backoff_max;
        op->transport_retry_count = cfg_.transport_retry_count;

        if (options.rate_controller) {
            op->rate = options.rate_controller;
        } else {
            RatePreset preset = options.rate_preset.value_or(
                kind == OperationKind::Delete ? RatePreset::Conservative
                                              : cfg_.default_rate_preset);
            op->rate = std::make_shared<RateController>(preset);
        }

        for (std::size_t first = 0; first < op->records.size();
             first += batch_size) {
            Operation::Batch b;
            b.first = first;
            b.count = std::min(batch_size, op->records.size() - first);
            op->batches.push_back(b);
        }

        spdlog::info(
            "{} of {} record(s) on '{}': {} batch(es) of up to {}, preset {}",
            to_string(op->kind), op->records.size(), op->entity,
            op->batches.size(), batch_size, to_string(op->rate->preset()));

        const auto started = clock_type::now();
        auto ex = co_await boost::asio::this_coro::executor;
        op->timer = std::make_shared<boost::asio::steady_timer>(ex);
        auto registration = token.on_cancel([op] { op->wake(); });

        for (;;) {
            std::vector<std::size_t> launch;
            clock_type::duration wait = kDispatchSlice;
            bool done = false;
            {
                std::lock_guard<std::mutex> lk(op->mu);
                op->wake_pending = false;
                const auto now = clock_type::now();

                if (op->token.is_cancelled()) op->cancelled = true;

                if (op->cancelled) {
                    for (auto b : op->backoff) {
                        op->fail_locked(b, FailureKind::Cancelled,
                                        "Cancelled during throttle backoff");
                    }
                    op->backoff.clear();
                    for (; op->next_batch < op->batches.size();
                         ++op->next_batch) {
                        op->fail_locked(op->next_batch, FailureKind::Cancelled,
                                        "Cancelled before the batch was sent");
                    }
                } else if (op->stop) {
                    if (!op->drain_on_stop) {
                        for (auto b : op->backoff) {
                            op->fail_locked(
                                b, FailureKind::NotAttempted,
                                "Not retried after a record failed");
                        }
                        op->backoff.clear();
                    }
                    for (; op->next_batch < op->batches.size();
                         ++op->next_batch) {
                        op->fail_locked(op->next_batch,
                                        FailureKind::NotAttempted,
                                        "Not attempted after a record failed");
                    }
                }

                if (!op->cancelled) {
                    // Re-read every pass, the budget moves with feedback
                    const std::size_t limit =
                        std::min(op->rate->current_budget(), op->max_parallel);
                    while (op->in_flight < limit) {
                        auto ready = std::find_if(
                            op->backoff.begin(), op->backoff.end(),
                            [&](std::size_t b) {
                                return op->batches[b].ready_at <= now;
                            });
                        std::size_t b = 0;
                        if (ready != op->backoff.end()) {
                            b = *ready;
                            op->backoff.erase(ready);
                        } else if (!op->stop &&
                                   op->next_batch < op->batches.size()) {
                            b = op->next_batch++;
                        } else {
                            break;
                        }
                        op->batches[b].state = BatchState::Running;
                        ++op->in_flight;
                        launch.push_back(b);
                    }
                    for (auto b : op->backoff) {
                        auto ready_at = op->batches[b].ready_at;
                        if (ready_at > now) wait = std::min(wait, ready_at - now);
                    }
                }

                done = op->in_flight == 0 && launch.empty() &&
                       op->backoff.empty() &&
                       op->next_batch == op->batches.size();
            }

            for (auto b : launch) {
                spdlog::debug("Dispatching batch {}/{} of '{}'", b + 1,
                              op->batches.size(), op->entity);
                boost::asio::co_spawn(
                    ex, run_batch_(op, b), [op, b](std::exception_ptr e) {
                        std::optional<std::string> failure;
                        if (e) {
                            try {
                                std::rethrow_exception(e);
                            } catch (const std::exception& err) {
                                failure = err.what();
                            } catch (...) {
                                failure = "unknown exception";
                            }
                        }
                        {
                            std::lock_guard<std::mutex> lk(op->mu);
                            if (failure &&
                                op->batches[b].state == BatchState::Running) {
                                op->fail_locked(b, FailureKind::TransportFault,
                                                "Batch aborted: " + *failure);
                                op->note_failure_locked();
                            }
                            --op->in_flight;
                        }
                        op->wake();
                    });
            }

            if (done) break;

            {
                std::lock_guard<std::mutex> lk(op->mu);
                if (op->wake_pending) continue;
                op->timer->expires_after(wait);
            }
            boost::system::error_code ec;
            co_await op->timer->async_wait(
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        }
        registration.reset();

        BulkOperationResult result;
        {
            std::lock_guard<std::mutex> lk(op->mu);
            result = std::move(op->result);
            result.cancelled = op->cancelled;
        }
        std::sort(result.failures.begin(), result.failures.end(),
                  [](RecordFailure const& a, RecordFailure const& b) {
                      return a.index < b.index;
                  });
        result.total_count = op->records.size();
        result.batches_total = op->batches.size();
        result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            clock_type::now() - started);
        result.rate = op->rate->snapshot();

        spdlog::info(
            "{} on '{}' finished in {} ms: {} succeeded, {} failed, {} "
            "throttle event(s), budget {}{}{}",
            to_string(op->kind), op->entity, result.elapsed.count(),
            result.success_count, result.failed_count, result.throttle_events,
            result.rate.budget, result.cancelled ? ", cancelled" : "",
            result.stopped_on_error ? ", stopped on error" : "");

        co_return R::ok(std::move(result));
    }

    boost::asio::awaitable<void> BulkOperationExecutor::run_batch_(
        std::shared_ptr<Operation> op, std::size_t b) {
        BatchRequest request;
        request.entity = op->entity;
        request.kind = op->kind;
        {
            std::lock_guard<std::mutex> lk(op->mu);
            auto const& batch = op->batches[b];
            auto begin = op->records.begin() +
                         static_cast<std::ptrdiff_t>(batch.first);
            request.records.assign(
                begin, begin + static_cast<std::ptrdiff_t>(batch.count));
        }

        std::size_t transport_attempts = 0;
        for (;;) {
            auto leased = co_await op->pool->acquire(op->token);
            if (leased.has_error()) {
                const Error err = leased.error();
                const bool creation =
                    err.code == Error::Code::ConnectionCreationFailed;

                if (creation && transport_attempts < op->transport_retry_count) {
                    ++transport_attempts;
                    {
                        std::lock_guard<std::mutex> lk(op->mu);
                        ++op->result.batches_retried;
                    }
                    spdlog::debug("Batch {} retrying after creation failure: {}",
                                  b + 1, err.message);
                    continue;
                }

                std::lock_guard<std::mutex> lk(op->mu);
                if (err.code == Error::Code::Cancelled) {
                    op->cancelled = true;
                    op->fail_locked(b, FailureKind::Cancelled,
                                    "Cancelled while waiting for a connection");
                } else {
                    spdlog::warn("Batch {} could not lease a connection: {}",
                                 b + 1, err.message);
                    op->fail_locked(b,
                                    creation
                                        ? FailureKind::ConnectionCreationFailed
                                        : FailureKind::TransportFault,
                                    err.message);
                    op->note_failure_locked();
                }
                co_return;
            }

            auto lease = std::move(leased).value();
            auto sent = co_await lease.execute(request);

            BatchResponse response;
            if (sent.has_error()) {
                response.outcome = BatchTransportFault{sent.error().message, false};
            } else {
                response = std::move(sent).value();
            }
            BatchOutcome& outcome = response.outcome;

            if (auto* ok = std::get_if<BatchSucceeded>(&outcome)) {
                lease.release();
                op->rate->on_success();
                std::lock_guard<std::mutex> lk(op->mu);
                op->settle_locked(b, ok->records, /*missing_succeeded=*/true);
                co_return;
            }

            if (auto* partial = std::get_if<BatchPartiallyFailed>(&outcome)) {
                lease.release();
                op->rate->on_success();
                std::lock_guard<std::mutex> lk(op->mu);
                op->settle_locked(b, partial->records,
                                  /*missing_succeeded=*/false);
                co_return;
            }

            if (auto* throttled = std::get_if<BatchThrottled>(&outcome)) {
                if (throttled->retry_after) {
                    throttled->retry_after = std::clamp(
                        *throttled->retry_after, std::chrono::milliseconds(0),
                        max_retry_after);
                }
                lease.mark_throttled(throttled->retry_after);
                lease.release();
                op->rate->on_throttled(throttled->retry_after);

                std::lock_guard<std::mutex> lk(op->mu);
                ++op->result.throttle_events;
                auto& batch = op->batches[b];
                ++batch.throttle_attempts;
                if (batch.throttle_attempts > op->max_throttle_retries) {
                    spdlog::warn("Batch {} of '{}' still throttled after {} "
                                 "retries, giving up",
                                 b + 1, op->entity, op->max_throttle_retries);
                    op->fail_locked(
                        b, FailureKind::ThrottledExhaustedRetries,
                        "Throttled " + std::to_string(batch.throttle_attempts) +
                            " time(s): " + throttled->message);
                    op->note_failure_locked();
                    co_return;
                }

                auto delay = throttle_backoff(batch.throttle_attempts,
                                              op->backoff_base,
                                              op->backoff_max);
                if (throttled->retry_after && *throttled->retry_after > delay) {
                    delay = *throttled->retry_after;
                }
                batch.ready_at = clock_type::now() + delay;
                batch.state = BatchState::Backoff;
                op->backoff.push_back(b);
                ++op->result.batches_retried;
                spdlog::debug("Batch {} throttled (attempt {}), retry in {} ms",
                              b + 1, batch.throttle_attempts, delay.count());
                co_return;
            }

            auto const& fault = std::get<BatchTransportFault>(outcome);
            lease.mark_faulted();
            lease.release();

            if (transport_attempts < op->transport_retry_count) {
                ++transport_attempts;
                {
                    std::lock_guard<std::mutex> lk(op->mu);
                    ++op->result.batches_retried;
                }
                spdlog::warn("Batch {} hit a {} fault, retrying on a fresh "
                             "connection: {}",
                             b + 1,
                             fault.authentication ? "authentication"
                                                  : "transport",
                             fault.message);
                continue;
            }

            spdlog::warn("Batch {} of '{}' failed after {} transport "
                         "retr(ies): {}",
                         b + 1, op->entity, transport_attempts, fault.message);
            std::lock_guard<std::mutex> lk(op->mu);
            op->fail_locked(b, FailureKind::TransportFault, fault.message);
            op->note_failure_locked();
            co_return;
        }
    }

    boost::asio::awaitable<Result<BulkOperationResult>>
    BulkOperationExecutor::create_multiple(std::string entity,
                                           std::vector<Record> records,
                                           BulkOperationOptions options,
                                           CancellationToken token) {
        co_return co_await submit(std::move(entity), std::move(records),
                                  OperationKind::Create, std::move(options),
                                  std::move(token));
    }

    boost::asio::awaitable<Result<BulkOperationResult>>
    BulkOperationExecutor::update_multiple(std::string entity,
                                           std::vector<Record> records,
                                           BulkOperationOptions options,
                                           CancellationToken token) {
        co_return co_await submit(std::move(entity), std::move(records),
                                  OperationKind::Update, std::move(options),
                                  std::move(token));
    }

    boost::asio::awaitable<Result<BulkOperationResult>>
    BulkOperationExecutor::upsert_multiple(std::string entity,
                                           std::vector<Record> records,
                                           BulkOperationOptions options,
                                           CancellationToken token) {
        co_return co_await submit(std::move(entity), std::move(records),
                                  OperationKind::Upsert, std::move(options),
                                  std::move(token));
    }

    boost::asio::awaitable<Result<BulkOperationResult>>
    BulkOperationExecutor::delete_multiple(std::string entity,
                                           std::vector<std::string> ids,
                                           BulkOperationOptions options,
                                           CancellationToken token) {
        std::vector<Record> records;
        records.reserve(ids.size());
        for (auto& id : ids) {
            records.push_back(Record{std::move(id), {}});
        }
        co_return co_await submit(std::move(entity), std::move(records),
                                  OperationKind::Delete, std::move(options),
                                  std::move(token));
    }

}  // namespace bulk_cpp
