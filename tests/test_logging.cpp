#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cctype>
#include <sstream>

#include "docwire/logging.hpp"

using namespace docwire;

namespace {

    class LoggingTest : public ::testing::Test {
       protected:
        void SetUp() override {
            auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(m_out);
            sink->set_pattern("%v");
            set_log_sink(sink);
            set_log_level(spdlog::level::debug);
        }

        void TearDown() override {
            set_log_level(spdlog::level::warn);
            set_log_sink(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        }

        std::ostringstream m_out;
    };

    TEST_F(LoggingTest, LinesCarryTagAndComponent) {
        log_debug("BulkWriter.flush", "abcde", "Flushing {} writes", 3);
        EXPECT_EQ(m_out.str(), "abcde [BulkWriter.flush]: Flushing 3 writes\n");
    }

    TEST_F(LoggingTest, EmptyTagIsPlaceholder) {
        log_warn("ResourcePool.destroy", {}, "failed");
        EXPECT_EQ(m_out.str(), "##### [ResourcePool.destroy]: failed\n");
    }

    TEST_F(LoggingTest, LevelFiltersDebug) {
        set_log_level(spdlog::level::warn);
        log_debug("X.y", "abcde", "hidden");
        EXPECT_TRUE(m_out.str().empty());
    }

    TEST(RequestTagTest, FiveAlphanumericCharacters) {
        const auto tag = make_request_tag();
        ASSERT_EQ(tag.size(), 5u);
        for (char c : tag) EXPECT_TRUE(std::isalnum(static_cast<unsigned char>(c)));
    }

}  // namespace
