#pragma once

#include <spdlog/logger.h>
#include <spdlog/sinks/sink.h>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace docwire {

    /// @brief The library-wide logger ("docwire"). Created on first use with
    /// a stderr sink at level warn.
    const std::shared_ptr<spdlog::logger>& logger();

    /// @brief Change the library log level (spdlog::level::off disables it).
    void set_log_level(spdlog::level::level_enum level);

    /// @brief Route library logs to `sink` instead of stderr.
    void set_log_sink(spdlog::sink_ptr sink);

    /// @brief A short random identifier attached to every log line of one
    /// logical request.
    std::string make_request_tag();

    /// @brief Emit "<tag> [<method>]: <message>" at the given level.
    /// An empty tag prints as "#####".
    template <typename... Args>
    void log(spdlog::level::level_enum level, std::string_view method,
             std::string_view tag, spdlog::format_string_t<Args...> format,
             Args&&... args) {
        const auto& lg = logger();
        if (!lg->should_log(level)) return;
        lg->log(level, "{} [{}]: {}", tag.empty() ? "#####" : tag, method,
                fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void log_debug(std::string_view method, std::string_view tag,
                   spdlog::format_string_t<Args...> format, Args&&... args) {
        log(spdlog::level::debug, method, tag, format,
            std::forward<Args>(args)...);
    }

    template <typename... Args>
    void log_warn(std::string_view method, std::string_view tag,
                  spdlog::format_string_t<Args...> format, Args&&... args) {
        log(spdlog::level::warn, method, tag, format,
            std::forward<Args>(args)...);
    }

}  // namespace docwire
