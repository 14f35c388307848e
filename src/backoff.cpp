#include "docwire/backoff.hpp"

#include <algorithm>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cmath>
#include <cstdint>
#include <random>

#include "docwire/logging.hpp"

namespace docwire {

    namespace {
        double uniform_unit() {
            thread_local std::mt19937_64 gen{std::random_device{}()};
            std::uniform_real_distribution<double> dist(0.0, 1.0);
            return dist(gen);
        }
    }  // namespace

    ExponentialBackoff::ExponentialBackoff(BackoffSettings settings)
        : m_settings(settings), m_random(&uniform_unit) {}

    void ExponentialBackoff::reset() noexcept {
        m_retry_count = 0;
        m_current_base_ms = 0;
    }

    void ExponentialBackoff::reset_to_max() noexcept {
        m_current_base_ms = static_cast<double>(m_settings.max_delay.count());
    }

    std::chrono::milliseconds ExponentialBackoff::current_base()
        const noexcept {
        return std::chrono::milliseconds(
            static_cast<std::int64_t>(m_current_base_ms));
    }

    void ExponentialBackoff::cancel() noexcept {
        if (m_timer) m_timer->cancel();
    }

    double ExponentialBackoff::jitter_ms() const {
        return (m_random() - 0.5) * m_settings.jitter_factor *
               m_current_base_ms;
    }

    boost::asio::awaitable<Result<void>>
    ExponentialBackoff::backoff_and_wait() {
        if (m_waiting) {
            co_return Result<void>::err(
                Error{Error::Code::FailedPrecondition,
                      "A backoff operation is already in progress."});
        }
        if (m_retry_count > kMaxRetryAttempts) {
            co_return Result<void>::err(
                Error{Error::Code::ResourceExhausted,
                      "Exceeded maximum number of retries allowed."});
        }

        const double delay_ms =
            std::max(0.0, m_current_base_ms + jitter_ms());
        if (m_current_base_ms > 0) {
            log_debug("ExponentialBackoff.backoff_and_wait", {},
                      "Backing off for {} ms (base delay: {} ms)",
                      static_cast<std::int64_t>(delay_ms),
                      static_cast<std::int64_t>(m_current_base_ms));
        }

        m_current_base_ms = std::clamp(
            m_current_base_ms * m_settings.backoff_factor,
            static_cast<double>(m_settings.initial_delay.count()),
            static_cast<double>(m_settings.max_delay.count()));
        ++m_retry_count;

        m_waiting = true;
        auto ex = co_await boost::asio::this_coro::executor;
        m_timer = std::make_shared<boost::asio::steady_timer>(
            ex, std::chrono::milliseconds(
                    static_cast<std::int64_t>(std::llround(delay_ms))));
        auto timer = m_timer;

        boost::system::error_code ec;
        co_await timer->async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        m_waiting = false;
        m_timer.reset();

        if (ec == boost::asio::error::operation_aborted) {
            co_return Result<void>::err(
                Error{Error::Code::Cancelled, "Backoff was cancelled."});
        }
        co_return Result<void>::ok();
    }

}  // namespace docwire
