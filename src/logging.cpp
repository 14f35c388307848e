#include "docwire/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <random>

namespace docwire {

    namespace {
        std::shared_ptr<spdlog::logger>& logger_slot() {
            static std::shared_ptr<spdlog::logger> lg = [] {
                auto l = std::make_shared<spdlog::logger>(
                    "docwire",
                    std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
                l->set_level(spdlog::level::warn);
                return l;
            }();
            return lg;
        }
    }  // namespace

    const std::shared_ptr<spdlog::logger>& logger() { return logger_slot(); }

    void set_log_level(spdlog::level::level_enum level) {
        logger_slot()->set_level(level);
    }

    void set_log_sink(spdlog::sink_ptr sink) {
        auto& slot = logger_slot();
        auto level = slot->level();
        slot = std::make_shared<spdlog::logger>("docwire", std::move(sink));
        slot->set_level(level);
    }

    std::string make_request_tag() {
        static constexpr char kChars[] =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
        thread_local std::mt19937 gen{std::random_device{}()};
        std::uniform_int_distribution<std::size_t> dist(0, sizeof(kChars) - 2);

        std::string tag(5, ' ');
        for (auto& c : tag) c = kChars[dist(gen)];
        return tag;
    }

}  // namespace docwire
