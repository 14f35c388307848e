#include "docwire/rpc/duplex_stream.hpp"

#include "docwire/logging.hpp"

namespace docwire {

    DuplexStream::DuplexStream(std::unique_ptr<RawStream> raw,
                               std::shared_ptr<Signal> lifetime,
                               std::string tag)
        : m_raw(std::move(raw)),
          m_lifetime(std::move(lifetime)),
          m_tag(std::move(tag)) {}

    DuplexStream::~DuplexStream() { end(); }

    boost::asio::awaitable<Result<std::shared_ptr<DuplexStream>>>
    DuplexStream::open(std::unique_ptr<RawStream> raw,
                       std::shared_ptr<Signal> lifetime, std::string tag,
                       std::optional<std::string> first_write) {
        using R = Result<std::shared_ptr<DuplexStream>>;

        std::shared_ptr<DuplexStream> stream(
            new DuplexStream(std::move(raw), std::move(lifetime), tag));

        if (first_write) {
            log_debug("DuplexStream.open", tag, "Sending request: {}",
                      *first_write);
            auto written = co_await stream->m_raw->write(std::move(*first_write));
            if (written.has_error()) {
                log_debug("DuplexStream.open", tag,
                          "Received initial error: {}",
                          written.error().message);
                stream->end();
                co_return R::err(std::move(written).error());
            }
            log_debug("DuplexStream.open", tag, "Marking stream as healthy");
            stream->m_state = State::Ready;
            co_return R::ok(std::move(stream));
        }

        StreamEvent first = co_await stream->m_raw->read();
        if (first.is_error()) {
            Error err = first.error.value_or(
                Error{Error::Code::Unknown, "stream failed"});
            log_debug("DuplexStream.open", tag, "Received initial error: {}",
                      err.message);
            stream->end();
            co_return R::err(std::move(err));
        }

        if (first.is_end()) {
            log_debug("DuplexStream.open", tag, "Received stream end");
        } else {
            log_debug("DuplexStream.open", tag, "Releasing stream");
        }
        stream->m_buffered.emplace(std::move(first));
        stream->m_state = State::Ready;
        co_return R::ok(std::move(stream));
    }

    boost::asio::awaitable<StreamEvent> DuplexStream::read() {
        if (m_buffered) {
            StreamEvent ev = std::move(*m_buffered);
            m_buffered.reset();
            if (ev.is_end()) end();
            co_return ev;
        }

        if (m_state == State::Ended) co_return StreamEvent::end_event();

        StreamEvent ev = co_await m_raw->read();
        if (ev.is_end()) {
            log_debug("DuplexStream.read", m_tag, "Received stream end");
            end();
        } else if (ev.is_error()) {
            log_debug("DuplexStream.read", m_tag, "Received stream error: {}",
                      ev.error ? ev.error->message : std::string());
            end();
        }
        co_return ev;
    }

    boost::asio::awaitable<Result<void>> DuplexStream::write(
        std::string message) {
        if (m_state == State::Ended) {
            co_return Result<void>::err(Error{Error::Code::FailedPrecondition,
                                              "The stream has already ended"});
        }
        co_return co_await m_raw->write(std::move(message));
    }

    void DuplexStream::end() noexcept {
        if (m_state == State::Ended) return;
        m_state = State::Ended;
        if (m_raw) m_raw->end();
        if (m_lifetime) m_lifetime->set();
    }

}  // namespace docwire
