#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docwire/rpc/channel.hpp"

namespace docwire::test {

    /// Shared view of one FakeRawStream, kept by the test after the stream
    /// has been handed to the client.
    struct RawStreamState {
        std::deque<StreamEvent> events;
        std::vector<std::string> writes;
        std::optional<Error> write_error;
        bool ended = false;
    };

    class FakeRawStream : public RawStream {
       public:
        explicit FakeRawStream(std::shared_ptr<RawStreamState> state)
            : m_state(std::move(state)) {}

        boost::asio::awaitable<StreamEvent> read() override {
            if (m_state->events.empty()) co_return StreamEvent::end_event();
            StreamEvent ev = std::move(m_state->events.front());
            m_state->events.pop_front();
            co_return ev;
        }

        boost::asio::awaitable<Result<void>> write(std::string message) override {
            if (m_state->write_error) {
                co_return Result<void>::err(*m_state->write_error);
            }
            m_state->writes.push_back(std::move(message));
            co_return Result<void>::ok();
        }

        void end() noexcept override { m_state->ended = true; }

       private:
        std::shared_ptr<RawStreamState> m_state;
    };

    /// What the fake backend does and what it has seen.
    struct ChannelScript {
        struct Call {
            std::string method;
            std::optional<std::string> request;
            CallOptions options;
        };

        /// Response of a unary call; defaults to an empty success.
        std::function<Result<std::string>(const Call&)> on_unary;
        /// Events of the n-th opened stream (0-based).
        std::function<std::deque<StreamEvent>(std::size_t)> on_open;
        std::optional<Error> write_error;

        std::vector<Call> unary_calls;
        std::vector<Call> stream_opens;
        std::vector<std::shared_ptr<RawStreamState>> streams;
        int channels_created = 0;
        int channels_closed = 0;
    };

    class FakeChannel : public RpcChannel {
       public:
        explicit FakeChannel(std::shared_ptr<ChannelScript> script)
            : m_script(std::move(script)) {}

        boost::asio::awaitable<Result<std::string>> unary(
            std::string method, std::string request,
            CallOptions options) override {
            auto script = m_script;
            script->unary_calls.push_back(
                {std::move(method), std::move(request), std::move(options)});
            if (script->on_unary) co_return script->on_unary(script->unary_calls.back());
            co_return Result<std::string>::ok("");
        }

        boost::asio::awaitable<Result<std::unique_ptr<RawStream>>> open_stream(
            std::string method, std::optional<std::string> request,
            CallOptions options) override {
            auto script = m_script;
            auto state = std::make_shared<RawStreamState>();
            if (script->on_open) state->events = script->on_open(script->streams.size());
            state->write_error = script->write_error;
            script->streams.push_back(state);
            script->stream_opens.push_back(
                {std::move(method), std::move(request), std::move(options)});
            co_return Result<std::unique_ptr<RawStream>>::ok(
                std::make_unique<FakeRawStream>(state));
        }

        boost::asio::awaitable<Result<void>> close() override {
            ++m_script->channels_closed;
            co_return Result<void>::ok();
        }

       private:
        std::shared_ptr<ChannelScript> m_script;
    };

    inline std::function<std::shared_ptr<RpcChannel>()> fake_channel_factory(
        std::shared_ptr<ChannelScript> script) {
        return [script] {
            ++script->channels_created;
            return std::make_shared<FakeChannel>(script);
        };
    }

}  // namespace docwire::test
