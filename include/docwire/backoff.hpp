#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

#include "config.hpp"
#include "result.hpp"

namespace docwire {

    /**
     * @brief Produces increasing delays between retries.
     *
     * The first backoff_and_wait() returns almost immediately (base 0 plus
     * jitter of 0). Every later call waits for the current base delay,
     * randomised by `jitter_factor`, and grows the base by `backoff_factor`
     * within [initial_delay, max_delay].
     *
     * One wait at a time: a second concurrent call fails instead of
     * queueing.
     */
    class ExponentialBackoff {
       public:
        /// @brief Retries allowed before backoff_and_wait() refuses to wait.
        static constexpr std::size_t kMaxRetryAttempts = 10;

        explicit ExponentialBackoff(BackoffSettings settings = {});

        ExponentialBackoff(const ExponentialBackoff&) = delete;
        ExponentialBackoff& operator=(const ExponentialBackoff&) = delete;

        /// @brief Forget all attempts; the next wait is immediate again.
        void reset() noexcept;

        /// @brief Make the next wait use the maximum delay. Used after
        /// RESOURCE_EXHAUSTED.
        void reset_to_max() noexcept;

        /**
         * @brief Wait for the current delay on the calling coroutine's
         * executor.
         * @return Ok once the delay has elapsed; FailedPrecondition if a
         * wait is already in progress; ResourceExhausted once
         * kMaxRetryAttempts retries were made; Cancelled after cancel().
         */
        boost::asio::awaitable<Result<void>> backoff_and_wait();

        /// @brief Abort an in-progress wait.
        void cancel() noexcept;

        /// @brief Number of waits performed since construction or reset().
        std::size_t retry_count() const noexcept { return m_retry_count; }

        /// @brief Current base delay (without jitter).
        std::chrono::milliseconds current_base() const noexcept;

        /// @brief Replace the uniform [0, 1) source used for jitter.
        void set_random_source(std::function<double()> source) {
            m_random = std::move(source);
        }

       private:
        double jitter_ms() const;

        BackoffSettings m_settings;
        double m_current_base_ms{0};
        std::size_t m_retry_count{0};
        bool m_waiting{false};
        std::function<double()> m_random;
        std::shared_ptr<boost::asio::steady_timer> m_timer;
    };

}  // namespace docwire
