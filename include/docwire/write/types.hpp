#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "docwire/error.hpp"

namespace docwire {

    /**
     * @brief Path of a document relative to the database root, e.g.
     * "users/alice".
     */
    struct DocumentRef {
        std::string path;

        /// @brief Last path segment.
        std::string_view id() const noexcept {
            std::string_view p(path);
            auto slash = p.rfind('/');
            return slash == std::string_view::npos ? p : p.substr(slash + 1);
        }

        friend bool operator==(const DocumentRef&,
                               const DocumentRef&) = default;
        friend bool operator<(const DocumentRef& a, const DocumentRef& b) {
            return a.path < b.path;
        }
    };

    /// @brief Seconds and nanoseconds since the Unix epoch, UTC.
    struct Timestamp {
        std::int64_t seconds{0};
        std::int32_t nanos{0};

        friend bool operator==(const Timestamp&, const Timestamp&) = default;
    };

    /// @brief Parse an RFC 3339 UTC timestamp ("2024-01-02T03:04:05.5Z").
    std::optional<Timestamp> parse_rfc3339(std::string_view text);

    /// @brief Format as RFC 3339 UTC with nanosecond precision.
    std::string to_rfc3339(const Timestamp& ts);

    enum class WriteKind : std::uint8_t { Create, Set, Update, Delete };

    inline const char* to_string(WriteKind kind) {
        switch (kind) {
            case WriteKind::Create:
                return "create";
            case WriteKind::Set:
                return "set";
            case WriteKind::Update:
                return "update";
            case WriteKind::Delete:
                return "delete";
        }
        return "unknown";
    }

    /// @brief Condition the stored document must meet for a write to apply.
    struct Precondition {
        std::optional<bool> exists;
        std::optional<Timestamp> last_update_time;

        bool empty() const noexcept {
            return !exists.has_value() && !last_update_time.has_value();
        }
    };

    /**
     * @brief One queued mutation. `data` holds the already encoded fields
     * of the document (opaque to the batching layer).
     */
    struct PendingWrite {
        WriteKind kind{WriteKind::Set};
        DocumentRef ref;
        std::string data;
        bool merge{false};
        Precondition precondition;
    };

    /// @brief Outcome of a successful write.
    struct WriteResult {
        Timestamp write_time;
    };

    /// @brief Per-operation result of a batch commit. `write_time` is set
    /// exactly when `status.code` is Ok; deletes of missing documents carry
    /// Timestamp{}.
    struct BatchWriteResult {
        std::optional<Timestamp> write_time;
        Error status{Error::Code::Ok, {}};
    };

    /// @brief Failure of one BulkWriter operation, as seen by the error
    /// callback.
    struct BulkWriterError {
        Error::Code code{Error::Code::Unknown};
        std::string message;
        DocumentRef ref;
        WriteKind kind{WriteKind::Set};
        /// @brief Number of retries already made for this operation.
        std::size_t retry_count{0};
    };

}  // namespace docwire

namespace std {
    template <>
    struct hash<docwire::DocumentRef> {
        size_t operator()(docwire::DocumentRef const& ref) const noexcept {
            return std::hash<std::string>{}(ref.path);
        }
    };
}  // namespace std
