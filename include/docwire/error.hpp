#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace docwire {
    /**
     * @brief Represents an error that occurred during an RPC, a pooled
     * operation or a batched write.
     */
    struct Error {
        /**
         * @brief Enumeration of error codes.
         *
         * The first block mirrors the canonical RPC status codes so that
         * backend statuses map one to one.
         */
        enum class Code : std::uint8_t {
            Ok = 0,             /**< Not an error; used for per-write statuses. */
            Cancelled = 1,      /**< The operation was cancelled. */
            Unknown = 2,        /**< An unknown error occurred. */
            InvalidArgument = 3,  /**< The request was malformed. */
            DeadlineExceeded = 4, /**< The deadline expired. */
            NotFound = 5,         /**< The document or resource was not found. */
            AlreadyExists = 6,    /**< The document already exists. */
            PermissionDenied = 7, /**< Caller lacks permission. */
            ResourceExhausted = 8,  /**< Quota or rate limit exceeded. */
            FailedPrecondition = 9, /**< A precondition did not hold. */
            Aborted = 10,           /**< Contention; the call may be retried. */
            OutOfRange = 11,        /**< Argument out of range. */
            Unimplemented = 12,     /**< Method not supported by the backend. */
            Internal = 13,          /**< Backend internal error. */
            Unavailable = 14,       /**< Backend unreachable; transient. */
            DataLoss = 15,          /**< Unrecoverable data loss. */
            Unauthenticated = 16,   /**< Missing or invalid credentials. */

            ClientTerminated = 32, /**< The client pool has been terminated. */
            InvalidUrl = 33,       /**< The configured URL is malformed. */
        };

        /** @brief The error code. */
        Code code;
        /** @brief A descriptive error message. */
        std::string message;
    };

    /// @brief Message used for every operation attempted after terminate().
    inline constexpr std::string_view kClientTerminatedMessage =
        "The client has already been terminated";

    /// @brief Convert an error code to its canonical upper-case name.
    inline const char* to_string(Error::Code code) {
        switch (code) {
            case Error::Code::Ok:
                return "OK";
            case Error::Code::Cancelled:
                return "CANCELLED";
            case Error::Code::Unknown:
                return "UNKNOWN";
            case Error::Code::InvalidArgument:
                return "INVALID_ARGUMENT";
            case Error::Code::DeadlineExceeded:
                return "DEADLINE_EXCEEDED";
            case Error::Code::NotFound:
                return "NOT_FOUND";
            case Error::Code::AlreadyExists:
                return "ALREADY_EXISTS";
            case Error::Code::PermissionDenied:
                return "PERMISSION_DENIED";
            case Error::Code::ResourceExhausted:
                return "RESOURCE_EXHAUSTED";
            case Error::Code::FailedPrecondition:
                return "FAILED_PRECONDITION";
            case Error::Code::Aborted:
                return "ABORTED";
            case Error::Code::OutOfRange:
                return "OUT_OF_RANGE";
            case Error::Code::Unimplemented:
                return "UNIMPLEMENTED";
            case Error::Code::Internal:
                return "INTERNAL";
            case Error::Code::Unavailable:
                return "UNAVAILABLE";
            case Error::Code::DataLoss:
                return "DATA_LOSS";
            case Error::Code::Unauthenticated:
                return "UNAUTHENTICATED";
            case Error::Code::ClientTerminated:
                return "CLIENT_TERMINATED";
            case Error::Code::InvalidUrl:
                return "INVALID_URL";
        }
        return "UNKNOWN";
    }

    /// @brief Map an HTTP status code returned by the REST endpoint to an
    /// RPC code, following the standard HTTP/RPC status mapping.
    inline Error::Code code_from_http_status(int status) {
        if (status >= 200 && status < 300) return Error::Code::Ok;
        switch (status) {
            case 400:
                return Error::Code::InvalidArgument;
            case 401:
                return Error::Code::Unauthenticated;
            case 403:
                return Error::Code::PermissionDenied;
            case 404:
                return Error::Code::NotFound;
            case 409:
                return Error::Code::Aborted;
            case 412:
                return Error::Code::FailedPrecondition;
            case 416:
                return Error::Code::OutOfRange;
            case 429:
                return Error::Code::ResourceExhausted;
            case 499:
                return Error::Code::Cancelled;
            case 501:
                return Error::Code::Unimplemented;
            case 503:
                return Error::Code::Unavailable;
            case 504:
                return Error::Code::DeadlineExceeded;
            default:
                break;
        }
        if (status >= 500) return Error::Code::Internal;
        return Error::Code::Unknown;
    }

    /// @brief The fixed error returned once a pool has been terminated.
    inline Error client_terminated_error() {
        return Error{Error::Code::ClientTerminated,
                     std::string(kClientTerminatedMessage)};
    }
}  // namespace docwire
