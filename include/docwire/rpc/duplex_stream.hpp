#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "docwire/deferred.hpp"
#include "docwire/result.hpp"
#include "docwire/rpc/channel.hpp"

namespace docwire {

    /**
     * A stream that has passed its handshake.
     *
     * The handshake decides whether a freshly opened RawStream is healthy:
     * - the first Data or End event marks it Ready and is kept for the first
     *   read();
     * - an Error before that fails the handshake, so the call never started;
     * - for bidirectional streams a successful write of the initial request
     *   marks it Ready, a failed one fails the handshake.
     *
     * Once Ready, a backend error is delivered by read() as an Error event
     * and the stream moves to Ended.
     *
     * Ending the stream (end(), a terminal event, or destruction) ends the
     * raw stream and fires the lifetime signal the pooled call waits for
     * before it releases its channel.
     */
    class DuplexStream {
       public:
        enum class State : std::uint8_t { Unresolved, Ready, Ended };

        /**
         * @brief Run the handshake on `raw`.
         * @param raw Stream just returned by RpcChannel::open_stream().
         * @param lifetime Fired when the returned stream ends.
         * @param tag Request tag used in log lines.
         * @param first_write For bidirectional streams, the request to write
         * before the stream is considered healthy.
         * @return A Ready stream, or the error seen before it became ready.
         */
        static boost::asio::awaitable<Result<std::shared_ptr<DuplexStream>>>
        open(std::unique_ptr<RawStream> raw, std::shared_ptr<Signal> lifetime,
             std::string tag, std::optional<std::string> first_write);

        DuplexStream(const DuplexStream&) = delete;
        DuplexStream& operator=(const DuplexStream&) = delete;

        ~DuplexStream();

        /// @brief Next event. After End or Error, keeps returning End.
        boost::asio::awaitable<StreamEvent> read();

        /// @brief Send a message on a bidirectional stream.
        boost::asio::awaitable<Result<void>> write(std::string message);

        /// @brief End the stream and release the pooled channel.
        void end() noexcept;

        State state() const noexcept { return m_state; }

        const std::string& tag() const noexcept { return m_tag; }

       private:
        DuplexStream(std::unique_ptr<RawStream> raw,
                     std::shared_ptr<Signal> lifetime, std::string tag);

        std::unique_ptr<RawStream> m_raw;
        std::shared_ptr<Signal> m_lifetime;
        std::string m_tag;
        std::optional<StreamEvent> m_buffered;
        State m_state{State::Unresolved};
    };

    using DuplexStreamPtr = std::shared_ptr<DuplexStream>;

}  // namespace docwire
