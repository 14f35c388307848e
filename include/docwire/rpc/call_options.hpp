#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

#include "docwire/retry.hpp"

namespace docwire {

    /**
     * @brief Per-call settings handed to an RpcChannel.
     */
    struct CallOptions {
        /** @brief Headers sent with the call, including the routing header. */
        std::map<std::string, std::string> headers;

        /** @brief Extra query parameters (e.g. an API key). */
        std::map<std::string, std::string> query;

        /** @brief When set, the channel retries transient failures. */
        std::optional<RetrySettings> retry;

        /** @brief Deadline of one attempt. */
        std::optional<std::chrono::milliseconds> timeout;
    };

    /// @brief Header that routes a call to its database.
    inline constexpr const char* kResourcePrefixHeader =
        "google-cloud-resource-prefix";

}  // namespace docwire
