#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <chrono>
#include <stdexcept>

#include "docwire/rpc/interceptor.hpp"
#include "docwire/rpc/rpc_client.hpp"
#include "fake_channel.hpp"
#include "test_support.hpp"

using namespace docwire;
using namespace std::chrono_literals;

namespace {

    struct ClientFixture {
        boost::asio::io_context io;
        std::shared_ptr<test::ChannelScript> script =
            std::make_shared<test::ChannelScript>();
        std::unique_ptr<RpcClient> client;

        explicit ClientFixture(RpcClientConfiguration cfg = base_config()) {
            client = std::make_unique<RpcClient>(
                io.get_executor(), std::move(cfg),
                test::fake_channel_factory(script));
        }

        static RpcClientConfiguration base_config() {
            RpcClientConfiguration cfg;
            cfg.project_id = "test-project";
            cfg.stream_backoff.initial_delay = 1ms;
            cfg.stream_backoff.max_delay = 2ms;
            return cfg;
        }
    };

    TEST(RpcClientTest, UnaryCallCarriesRoutingAndDefaultHeaders) {
        auto cfg = ClientFixture::base_config();
        cfg.default_headers["x-goog-api-client"] = "docwire/1.0";
        cfg.interceptors.push_back(
            std::make_shared<BearerAuthInterceptor>("secret-token"));
        cfg.interceptors.push_back(std::make_shared<ApiKeyInterceptor>(
            "key", "abc", ApiKeyInterceptor::Location::Query));
        ClientFixture f(cfg);
        f.script->on_unary = [](const test::ChannelScript::Call& call) {
            return Result<std::string>::ok("response to " + *call.request);
        };

        auto response = test::await_result(
            f.io, f.client->unary_call("getDocument", "req", "tag01"));
        ASSERT_TRUE(response.has_value());
        EXPECT_EQ(response.value(), "response to req");

        ASSERT_EQ(f.script->unary_calls.size(), 1u);
        const auto& options = f.script->unary_calls[0].options;
        EXPECT_EQ(f.script->unary_calls[0].method, "getDocument");
        EXPECT_EQ(options.headers.at(kResourcePrefixHeader),
                  "projects/test-project/databases/(default)");
        EXPECT_EQ(options.headers.at("x-goog-api-client"), "docwire/1.0");
        EXPECT_EQ(options.headers.at("Authorization"), "Bearer secret-token");
        EXPECT_EQ(options.query.at("key"), "abc");
        EXPECT_FALSE(options.retry.has_value());
        EXPECT_EQ(options.timeout, cfg.request_timeout);
    }

    TEST(RpcClientTest, RetryCodesAreForwardedToTheChannel) {
        ClientFixture f;
        auto response = test::await_result(
            f.io, f.client->unary_call("batchWrite", "{}", "tag02",
                                       retry_codes("batchWrite")));
        ASSERT_TRUE(response.has_value());
        const auto& options = f.script->unary_calls.at(0).options;
        ASSERT_TRUE(options.retry.has_value());
        EXPECT_TRUE(options.retry->retries(Error::Code::Aborted));
        EXPECT_FALSE(options.retry->retries(Error::Code::Internal));
    }

    TEST(RpcClientTest, ConcurrentUnaryCallsShareOneChannel) {
        ClientFixture f;
        auto a = test::spawn(f.io, f.client->unary_call("getDocument", "a", "t1"));
        auto b = test::spawn(f.io, f.client->unary_call("getDocument", "b", "t2"));
        ASSERT_TRUE(test::run_until(f.io, *a.done));
        ASSERT_TRUE(test::run_until(f.io, *b.done));
        EXPECT_EQ(f.script->channels_created, 1);
        EXPECT_EQ(f.script->unary_calls.size(), 2u);
    }

    TEST(RpcClientTest, StreamDeliversDataThenError) {
        ClientFixture f;
        f.script->on_open = [](std::size_t) {
            return std::deque<StreamEvent>{
                StreamEvent::data_event("doc1"),
                StreamEvent::error_event(
                    Error{Error::Code::Unavailable, "backend went away"})};
        };

        auto opened = test::await_result(
            f.io, f.client->stream_call("runQuery", "query", "tag03"));
        ASSERT_TRUE(opened.has_value());
        auto stream = opened.value();
        EXPECT_EQ(f.client->pool().op_count(), 1u);

        auto first = test::await_result(f.io, stream->read());
        ASSERT_TRUE(first.is_data());
        EXPECT_EQ(first.data, "doc1");
        auto second = test::await_result(f.io, stream->read());
        ASSERT_TRUE(second.is_error());
        EXPECT_EQ(second.error->code, Error::Code::Unavailable);

        test::drain(f.io);
        EXPECT_EQ(f.client->pool().op_count(), 0u);
        EXPECT_EQ(f.script->stream_opens.size(), 1u);
        EXPECT_EQ(f.script->stream_opens[0].request, std::optional<std::string>("query"));
    }

    TEST(RpcClientTest, PermanentErrorBeforeDataFailsTheCall) {
        ClientFixture f;
        f.script->on_open = [](std::size_t) {
            return std::deque<StreamEvent>{StreamEvent::error_event(
                Error{Error::Code::PermissionDenied, "denied"})};
        };

        auto opened = test::await_result(
            f.io, f.client->stream_call("runQuery", "query", "tag04"));
        ASSERT_TRUE(opened.has_error());
        EXPECT_EQ(opened.error().code, Error::Code::PermissionDenied);
        EXPECT_EQ(f.script->stream_opens.size(), 1u);
        test::drain(f.io);
        EXPECT_EQ(f.client->pool().op_count(), 0u);
    }

    TEST(RpcClientTest, TransientErrorBeforeDataIsRetried) {
        ClientFixture f;
        f.script->on_open = [](std::size_t attempt) {
            if (attempt < 2) {
                return std::deque<StreamEvent>{StreamEvent::error_event(
                    Error{Error::Code::Unavailable, "try again"})};
            }
            return std::deque<StreamEvent>{StreamEvent::data_event("doc")};
        };

        auto opened = test::await_result(
            f.io, f.client->stream_call("runQuery", "query", "tag05"));
        ASSERT_TRUE(opened.has_value());
        EXPECT_EQ(f.script->stream_opens.size(), 3u);
        EXPECT_EQ(test::await_result(f.io, opened.value()->read()).data, "doc");
    }

    TEST(RpcClientTest, StreamRetriesStopAtMaxAttempts) {
        auto cfg = ClientFixture::base_config();
        cfg.max_stream_attempts = 3;
        ClientFixture f(cfg);
        f.script->on_open = [](std::size_t) {
            return std::deque<StreamEvent>{StreamEvent::error_event(
                Error{Error::Code::Unavailable, "still down"})};
        };

        auto opened = test::await_result(
            f.io, f.client->stream_call("runQuery", "query", "tag06"));
        ASSERT_TRUE(opened.has_error());
        EXPECT_EQ(opened.error().message, "still down");
        EXPECT_EQ(f.script->stream_opens.size(), 3u);
    }

    TEST(RpcClientTest, BidirectionalStreamSendsRequestAsFirstWrite) {
        ClientFixture f;
        auto opened = test::await_result(
            f.io, f.client->stream_call("listen", "add-target", "tag07"));
        ASSERT_TRUE(opened.has_value());
        ASSERT_EQ(f.script->stream_opens.size(), 1u);
        EXPECT_FALSE(f.script->stream_opens[0].request.has_value());
        EXPECT_EQ(f.script->streams[0]->writes,
                  std::vector<std::string>{"add-target"});
        EXPECT_TRUE(RpcClient::is_bidirectional("write"));
        EXPECT_FALSE(RpcClient::is_bidirectional("runQuery"));
    }

    TEST(RpcClientTest, DroppingTheStreamReleasesTheChannel) {
        ClientFixture f;
        f.script->on_open = [](std::size_t) {
            return std::deque<StreamEvent>{StreamEvent::data_event("doc")};
        };
        {
            auto opened = test::await_result(
                f.io, f.client->stream_call("runQuery", "query", "tag08"));
            ASSERT_TRUE(opened.has_value());
            EXPECT_EQ(f.client->pool().op_count(), 1u);
        }
        test::drain(f.io);
        EXPECT_EQ(f.client->pool().op_count(), 0u);
        EXPECT_TRUE(f.script->streams[0]->ended);
    }

    TEST(RpcClientTest, CallsFailAfterTerminate) {
        ClientFixture f;
        static_cast<void>(test::await_result(
            f.io, f.client->unary_call("getDocument", "req", "tag09")));
        EXPECT_TRUE(test::await_result(f.io, f.client->terminate()).has_value());
        EXPECT_EQ(f.script->channels_closed, 1);

        auto unary = test::await_result(
            f.io, f.client->unary_call("getDocument", "req", "tag10"));
        ASSERT_TRUE(unary.has_error());
        EXPECT_EQ(unary.error().code, Error::Code::ClientTerminated);

        auto stream = test::await_result(
            f.io, f.client->stream_call("runQuery", "query", "tag11"));
        ASSERT_TRUE(stream.has_error());
        EXPECT_EQ(stream.error().code, Error::Code::ClientTerminated);
        EXPECT_TRUE(f.script->stream_opens.empty());
    }

    TEST(RpcClientTest, StreamCallRethrowsFactoryMisuse) {
        boost::asio::io_context io;
        RpcClient client(io.get_executor(), ClientFixture::base_config(),
                         [] { return std::shared_ptr<RpcChannel>(); });

        EXPECT_THROW(
            static_cast<void>(test::await_result(
                io, client.stream_call("runQuery", "query", "tag12"),
                std::chrono::seconds(2))),
            std::logic_error);
        EXPECT_EQ(client.pool().op_count(), 0u);
    }

}  // namespace
