#pragma once

#include <chrono>
#include <cstddef>
#include <optional>

namespace docwire {

    /**
     * @brief Token bucket whose capacity grows over time.
     *
     * Starts at `initial_capacity` operations per second and multiplies the
     * capacity by `multiplier` every `multiplier_period`, up to
     * `maximum_capacity`. Tokens refill continuously at the current
     * capacity.
     *
     * Times are passed explicitly so the schedule can be tested without
     * waiting.
     */
    class RateLimiter {
       public:
        using Clock = std::chrono::steady_clock;

        RateLimiter(double initial_capacity, double multiplier,
                    std::chrono::milliseconds multiplier_period,
                    double maximum_capacity,
                    Clock::time_point start = Clock::now());

        /// @brief Consume `num_operations` tokens if that many are
        /// available.
        bool try_make_request(std::size_t num_operations,
                              Clock::time_point now = Clock::now());

        /**
         * @brief How long until `num_operations` tokens are available.
         * @return Zero if the request can be made now, std::nullopt if it
         * exceeds the capacity and can never be made.
         */
        std::optional<std::chrono::milliseconds> next_request_delay(
            std::size_t num_operations, Clock::time_point now = Clock::now());

        /// @brief Operations per second allowed at `now`.
        double calculate_capacity(Clock::time_point now);

        double available_tokens() const noexcept { return m_available; }

        double maximum_capacity() const noexcept { return m_maximum; }

       private:
        void refill_tokens(Clock::time_point now);

        double m_initial;
        double m_multiplier;
        std::chrono::milliseconds m_period;
        double m_maximum;
        Clock::time_point m_start;

        double m_available;
        Clock::time_point m_last_refill;
        double m_previous_capacity;
    };

}  // namespace docwire
