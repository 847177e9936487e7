#pragma once

#include <utility>  // before Boost.Asio: boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio/awaitable.hpp>
#include <memory>
#include <string>
#include <vector>

#include "bulk_cpp/bulk/bulk_operation_types.hpp"
#include "bulk_cpp/cancellation.hpp"
#include "bulk_cpp/config.hpp"
#include "bulk_cpp/connection/connection_pool.hpp"
#include "bulk_cpp/operation.hpp"
#include "bulk_cpp/result.hpp"

namespace bulk_cpp {

    /**
     * @brief Drives large homogeneous record sets through a ConnectionPool.
     *
     * Records are cut into contiguous batches. A dispatcher admits batches
     * while the number in flight stays below
     * min(rate budget, max_parallel_batches), re-reading both before every
     * admission. Each admitted batch leases its own connection, sends one
     * batch call and feeds the outcome back to the RateController.
     *
     * Every submitted record appears exactly once in the result, either as
     * a success or in the failure list, so
     * success_count + failed_count == records.size().
     *
     * Batches run as coroutines on the executor submit() is awaited on.
     * The executor object must outlive the submit() call; the pool is shared.
     */
    class BulkOperationExecutor {
       public:
        explicit BulkOperationExecutor(std::shared_ptr<ConnectionPool> pool,
                                       BulkOperationConfiguration cfg = {});

        /**
         * @brief Run one bulk operation to completion.
         * @param entity Target entity name.
         * @param records Ordered record set.
         * @param kind Operation applied to every record.
         * @param options Per-call overrides of the configured defaults.
         * @param token Cancels admission, lease waits and backoff delays.
         * @return The aggregated result, PoolUnavailable if the pool cannot
         * serve anything, or InvalidArgument for bad options. Record-level
         * failures are never returned as an error.
         */
        boost::asio::awaitable<Result<BulkOperationResult>> submit(
            std::string entity, std::vector<Record> records,
            OperationKind kind, BulkOperationOptions options = {},
            CancellationToken token = {});

        boost::asio::awaitable<Result<BulkOperationResult>> create_multiple(
            std::string entity, std::vector<Record> records,
            BulkOperationOptions options = {}, CancellationToken token = {});

        boost::asio::awaitable<Result<BulkOperationResult>> update_multiple(
            std::string entity, std::vector<Record> records,
            BulkOperationOptions options = {}, CancellationToken token = {});

        boost::asio::awaitable<Result<BulkOperationResult>> upsert_multiple(
            std::string entity, std::vector<Record> records,
            BulkOperationOptions options = {}, CancellationToken token = {});

        /// @brief Delete by record id.
        boost::asio::awaitable<Result<BulkOperationResult>> delete_multiple(
            std::string entity, std::vector<std::string> ids,
            BulkOperationOptions options = {}, CancellationToken token = {});

        BulkOperationConfiguration const& config() const noexcept {
            return cfg_;
        }

        std::shared_ptr<ConnectionPool> const& pool() const noexcept {
            return pool_;
        }

       private:
        struct Operation;

        static boost::asio::awaitable<void> run_batch_(
            std::shared_ptr<Operation> op, std::size_t batch);

        std::shared_ptr<ConnectionPool> pool_;
        BulkOperationConfiguration cfg_;
    };

}  // namespace bulk_cpp
