#pragma once
#include <string>

namespace bulk_cpp {
    /**
     * @brief Represents an error raised by the pool, the executor or a
     * remote session.
     */
    struct Error {
        /** @brief Enumeration of error codes. */
        enum class Code {
            PoolUnavailable,   /**< Pool disabled or no credentials configured. */
            ConnectionCreationFailed, /**< Session factory could not authenticate or connect. */
            Throttled,         /**< Remote service protection limit hit. */
            TransportFault,    /**< Connection broken mid-call or auth rejected. */
            RecordValidationFailure, /**< Remote service rejected a record. */
            Cancelled,         /**< Cancellation token fired. */
            Timeout,           /**< Acquire timeout elapsed. */
            Shutdown,          /**< Pool was shut down. */
            InvalidLease,      /**< Lease used after release. */
            InvalidArgument,   /**< Caller supplied a bad option. */
            ConfigurationError,/**< Configuration could not be parsed. */
            InvalidUrl,        /**< Malformed environment URL. */
            Unknown,           /**< An unknown error occurred. */
        };

        /** @brief The error code. */
        Code code;
        /** @brief A descriptive error message. */
        std::string message;
    };

    /// @brief Convert an error code to string for logging or diagnostics
    inline const char* to_string(Error::Code code) {
        switch (code) {
            case Error::Code::PoolUnavailable:
                return "PoolUnavailable";
            case Error::Code::ConnectionCreationFailed:
                return "ConnectionCreationFailed";
            case Error::Code::Throttled:
                return "Throttled";
            case Error::Code::TransportFault:
                return "TransportFault";
            case Error::Code::RecordValidationFailure:
                return "RecordValidationFailure";
            case Error::Code::Cancelled:
                return "Cancelled";
            case Error::Code::Timeout:
                return "Timeout";
            case Error::Code::Shutdown:
                return "Shutdown";
            case Error::Code::InvalidLease:
                return "InvalidLease";
            case Error::Code::InvalidArgument:
                return "InvalidArgument";
            case Error::Code::ConfigurationError:
                return "ConfigurationError";
            case Error::Code::InvalidUrl:
                return "InvalidUrl";
            case Error::Code::Unknown:
                return "Unknown";
        }
        return "Unknown";
    }
}  // namespace bulk_cpp
