#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace bulk_cpp {

    /** @brief Kind of bulk operation applied to a record set. */
    enum class OperationKind : std::uint8_t {
        Create,
        Update,
        Upsert,
        Delete,
    };

    inline constexpr const char* to_string(OperationKind kind) {
        switch (kind) {
            case OperationKind::Create:
                return "Create";
            case OperationKind::Update:
                return "Update";
            case OperationKind::Upsert:
                return "Upsert";
            case OperationKind::Delete:
                return "Delete";
        }
        return "Unknown";
    }

    /**
     * @brief One record of a homogeneous record set.
     *
     * The payload is opaque to this library; the remote session decides how
     * to serialize it. Delete operations only need the id.
     */
    struct Record {
        std::string id;
        std::string payload;
    };

    /// @brief Outcome of a single record inside a batch call.
    struct RecordOutcome {
        bool succeeded{true};
        /// Upsert only: true if the record was newly created, false if an
        /// existing record was modified, nullopt if the service did not say.
        std::optional<bool> created;
        std::string error_message;
    };

    /// @brief One remote batch call.
    struct BatchRequest {
        std::string entity;
        OperationKind kind{OperationKind::Create};
        std::vector<Record> records;
        /// Attached by the Connection when affinity is enabled.
        std::optional<std::string> affinity_token;
    };

    // Batch outcome alternatives

    /// @brief Every record succeeded. @c records may be empty when the service
    /// reports no per-record detail; otherwise it matches the batch order.
    struct BatchSucceeded {
        std::vector<RecordOutcome> records;
    };

    /// @brief Per-record fault isolation: some records failed. Records with no
    /// reported outcome are treated as failed.
    struct BatchPartiallyFailed {
        std::vector<RecordOutcome> records;
    };

    /// @brief Longest retry-after hint honored; larger hints are clamped.
    inline constexpr std::chrono::milliseconds max_retry_after{
        std::chrono::hours(24)};

    /// @brief The service rejected the whole batch with a service protection
    /// limit.
    struct BatchThrottled {
        std::optional<std::chrono::milliseconds> retry_after;
        std::string message;
    };

    /// @brief The call never completed: socket error, broken session or an
    /// authentication fault.
    struct BatchTransportFault {
        std::string message;
        bool authentication{false};
    };

    using BatchOutcome = std::variant<BatchSucceeded, BatchPartiallyFailed,
                                      BatchThrottled, BatchTransportFault>;

    /// @brief What a remote session returns for one batch call.
    struct BatchResponse {
        BatchOutcome outcome;
        /// Session-stickiness token issued by the service, if any.
        std::optional<std::string> affinity_token;
    };

}  // namespace bulk_cpp
