#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "docwire/error.hpp"

namespace docwire {

    /// @brief Counters for monitoring a ResourcePool
    struct ResourcePoolMetrics {
        std::atomic<std::uint64_t> clients_created{0};    ///< Factory calls
        std::atomic<std::uint64_t> clients_destroyed{0};  ///< Destructor calls
        std::atomic<std::uint64_t> destructor_failures{
            0};  ///< Destructors that reported an error
        std::atomic<std::uint64_t> clients_failed{
            0};  ///< Clients evicted after a channel-fatal error
        std::atomic<std::uint64_t> operations_run{0};  ///< Operations started
        std::atomic<std::uint64_t> operations_rejected{
            0};  ///< run() calls refused after terminate()
    };

    /// @brief Default channel-fatal test: the backend reset the underlying
    /// HTTP/2 stream, so the client must not be handed out again.
    inline bool is_rst_stream_error(const Error& err) {
        return std::string_view(err.message).find("RST_STREAM") !=
               std::string_view::npos;
    }

}  // namespace docwire
