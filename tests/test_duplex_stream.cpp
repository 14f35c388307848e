#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>

#include "docwire/rpc/duplex_stream.hpp"
#include "fake_channel.hpp"
#include "test_support.hpp"

using namespace docwire;

namespace {

    struct StreamFixture {
        boost::asio::io_context io;
        std::shared_ptr<test::RawStreamState> raw =
            std::make_shared<test::RawStreamState>();
        std::shared_ptr<Signal> lifetime = Signal::make(io.get_executor());

        Result<DuplexStreamPtr> open(std::optional<std::string> first_write = {}) {
            return test::await_result(
                io, DuplexStream::open(std::make_unique<test::FakeRawStream>(raw),
                                       lifetime, "tag01", std::move(first_write)));
        }
    };

    TEST(DuplexStreamTest, FirstDataEventIsReplayed) {
        StreamFixture f;
        f.raw->events = {StreamEvent::data_event("one"),
                         StreamEvent::data_event("two")};
        auto opened = f.open();
        ASSERT_TRUE(opened.has_value());
        auto stream = opened.value();
        EXPECT_EQ(stream->state(), DuplexStream::State::Ready);

        auto first = test::await_result(f.io, stream->read());
        ASSERT_TRUE(first.is_data());
        EXPECT_EQ(first.data, "one");
        auto second = test::await_result(f.io, stream->read());
        EXPECT_EQ(second.data, "two");

        EXPECT_FALSE(f.lifetime->ready());
        EXPECT_TRUE(test::await_result(f.io, stream->read()).is_end());
        EXPECT_EQ(stream->state(), DuplexStream::State::Ended);
        EXPECT_TRUE(f.raw->ended);
        EXPECT_TRUE(f.lifetime->ready());
    }

    TEST(DuplexStreamTest, ErrorBeforeDataFailsTheOpen) {
        StreamFixture f;
        f.raw->events = {StreamEvent::error_event(
            Error{Error::Code::PermissionDenied, "denied"})};
        auto opened = f.open();
        ASSERT_TRUE(opened.has_error());
        EXPECT_EQ(opened.error().code, Error::Code::PermissionDenied);
        EXPECT_TRUE(f.raw->ended);
        EXPECT_TRUE(f.lifetime->ready());
    }

    TEST(DuplexStreamTest, ErrorAfterDataIsDeliveredAsEvent) {
        StreamFixture f;
        f.raw->events = {StreamEvent::data_event("one"),
                         StreamEvent::error_event(
                             Error{Error::Code::Unavailable, "gone"})};
        auto stream = f.open().value();

        EXPECT_TRUE(test::await_result(f.io, stream->read()).is_data());
        auto failed = test::await_result(f.io, stream->read());
        ASSERT_TRUE(failed.is_error());
        EXPECT_EQ(failed.error->code, Error::Code::Unavailable);
        EXPECT_TRUE(test::await_result(f.io, stream->read()).is_end());
    }

    TEST(DuplexStreamTest, ImmediateEndIsAHealthyEmptyStream) {
        StreamFixture f;
        auto opened = f.open();
        ASSERT_TRUE(opened.has_value());
        EXPECT_FALSE(f.lifetime->ready());
        EXPECT_TRUE(test::await_result(f.io, opened.value()->read()).is_end());
        EXPECT_TRUE(f.lifetime->ready());
    }

    TEST(DuplexStreamTest, BidirectionalOpenWritesTheRequest) {
        StreamFixture f;
        auto stream = f.open(std::string("hello")).value();
        EXPECT_EQ(f.raw->writes, std::vector<std::string>{"hello"});

        EXPECT_TRUE(test::await_result(f.io, stream->write("more")).has_value());
        stream->end();
        auto late = test::await_result(f.io, stream->write("late"));
        ASSERT_TRUE(late.has_error());
        EXPECT_EQ(late.error().code, Error::Code::FailedPrecondition);
        EXPECT_EQ(f.raw->writes.size(), 2u);
    }

    TEST(DuplexStreamTest, FailedFirstWriteFailsTheOpen) {
        StreamFixture f;
        f.raw->write_error = Error{Error::Code::Unavailable, "write failed"};
        auto opened = f.open(std::string("hello"));
        ASSERT_TRUE(opened.has_error());
        EXPECT_EQ(opened.error().message, "write failed");
        EXPECT_TRUE(f.lifetime->ready());
    }

    TEST(DuplexStreamTest, DestructionEndsTheStream) {
        StreamFixture f;
        f.raw->events = {StreamEvent::data_event("one")};
        {
            auto stream = f.open().value();
            EXPECT_FALSE(f.lifetime->ready());
        }
        EXPECT_TRUE(f.raw->ended);
        EXPECT_TRUE(f.lifetime->ready());
    }

}  // namespace
