#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "bulk_cpp/rate/rate_controller.hpp"
#include "bulk_cpp/rate/rate_preset.hpp"

namespace bulk_cpp {

    /** @brief Why a record ended up in the failure list. */
    enum class FailureKind : std::uint8_t {
        RecordValidationFailure,   /**< Service rejected the record. */
        ThrottledExhaustedRetries, /**< Batch stayed throttled past the retry limit. */
        TransportFault,            /**< Batch lost to connection faults. */
        ConnectionCreationFailed,  /**< No session could be created for the batch. */
        Cancelled,                 /**< Cancellation fired before the batch finished. */
        NotAttempted,              /**< Batch never admitted after stop-on-error. */
    };

    inline constexpr const char* to_string(FailureKind kind) {
        switch (kind) {
            case FailureKind::RecordValidationFailure:
                return "RecordValidationFailure";
            case FailureKind::ThrottledExhaustedRetries:
                return "ThrottledExhaustedRetries";
            case FailureKind::TransportFault:
                return "TransportFault";
            case FailureKind::ConnectionCreationFailed:
                return "ConnectionCreationFailed";
            case FailureKind::Cancelled:
                return "Cancelled";
            case FailureKind::NotAttempted:
                return "NotAttempted";
        }
        return "Unknown";
    }

    /// @brief One failed record.
    struct RecordFailure {
        std::size_t index{0};  ///< Position in the submitted sequence
        std::string record_id;
        FailureKind classification{FailureKind::RecordValidationFailure};
        std::string message;
    };

    /**
     * @brief Per-call options of a bulk operation.
     *
     * Unset optionals fall back to BulkOperationConfiguration.
     */
    struct BulkOperationOptions {
        /// Keep admitting batches after a record failed.
        bool continue_on_error{true};

        /// Records per batch; must be at least 1.
        std::optional<std::size_t> batch_size;

        /// Hard cap on concurrent batches on top of the rate budget.
        std::optional<std::size_t> max_parallel_batches;

        /// Rate profile; Delete defaults to Conservative.
        std::optional<RatePreset> rate_preset;

        /// After stop-on-error, let batches waiting in throttle backoff run
        /// their retry (true) or fail them as NotAttempted (false).
        bool drain_on_stop{true};

        /// Share a controller across operations or observe it from outside.
        /// When set, rate_preset is ignored.
        std::shared_ptr<RateController> rate_controller;
    };

    /// @brief Aggregated outcome of one bulk operation.
    struct BulkOperationResult {
        std::size_t total_count{0};
        std::size_t success_count{0};
        std::size_t failed_count{0};

        /// Upsert only, when the service distinguishes the two
        std::size_t created_count{0};
        std::size_t updated_count{0};

        /// Sorted by RecordFailure::index
        std::vector<RecordFailure> failures;

        bool cancelled{false};
        bool stopped_on_error{false};

        std::size_t batches_total{0};
        std::size_t batches_retried{0};  ///< Throttle and transport retries
        std::size_t throttle_events{0};

        std::chrono::milliseconds elapsed{0};

        RateControllerSnapshot rate;

        bool all_succeeded() const noexcept {
            return failed_count == 0 && success_count == total_count;
        }
    };

}  // namespace bulk_cpp
