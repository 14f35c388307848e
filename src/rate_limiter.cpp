#include "docwire/write/rate_limiter.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>

#include "docwire/logging.hpp"

namespace docwire {

    namespace {
        double millis_between(RateLimiter::Clock::time_point from,
                              RateLimiter::Clock::time_point to) {
            return static_cast<double>(
                std::chrono::duration_cast<std::chrono::milliseconds>(to - from)
                    .count());
        }
    }  // namespace

    RateLimiter::RateLimiter(double initial_capacity, double multiplier,
                             std::chrono::milliseconds multiplier_period,
                             double maximum_capacity, Clock::time_point start)
        : m_initial(initial_capacity),
          m_multiplier(multiplier),
          m_period(multiplier_period),
          m_maximum(maximum_capacity),
          m_start(start),
          m_available(initial_capacity),
          m_last_refill(start),
          m_previous_capacity(initial_capacity) {}

    bool RateLimiter::try_make_request(std::size_t num_operations,
                                       Clock::time_point now) {
        refill_tokens(now);
        const auto n = static_cast<double>(num_operations);
        if (n <= m_available) {
            m_available -= n;
            return true;
        }
        return false;
    }

    std::optional<std::chrono::milliseconds> RateLimiter::next_request_delay(
        std::size_t num_operations, Clock::time_point now) {
        refill_tokens(now);
        const auto n = static_cast<double>(num_operations);
        if (n <= m_available) return std::chrono::milliseconds{0};

        const double capacity = calculate_capacity(now);
        if (capacity < n) return std::nullopt;

        const double required = n - m_available;
        return std::chrono::milliseconds(
            static_cast<std::int64_t>(std::ceil(required * 1000 / capacity)));
    }

    void RateLimiter::refill_tokens(Clock::time_point now) {
        if (now < m_last_refill) {
            throw std::invalid_argument(
                "Request time should not be before the last token refill "
                "time.");
        }
        const double elapsed = millis_between(m_last_refill, now);
        const double capacity = calculate_capacity(now);
        const double to_add = std::floor(elapsed * capacity / 1000);
        if (to_add > 0) {
            m_available = std::min(capacity, m_available + to_add);
            m_last_refill = now;
        }
    }

    double RateLimiter::calculate_capacity(Clock::time_point now) {
        if (now < m_start) {
            throw std::invalid_argument("startTime cannot be after currentTime");
        }
        double capacity = m_maximum;
        if (!std::isinf(m_initial)) {
            const double periods = std::floor(
                millis_between(m_start, now) /
                static_cast<double>(std::max<std::int64_t>(m_period.count(), 1)));
            capacity = std::min(
                std::floor(std::pow(m_multiplier, periods) * m_initial),
                m_maximum);
        }

        if (capacity != m_previous_capacity) {
            log_debug("RateLimiter.calculate_capacity", {},
                      "New request capacity: {} operations per second.",
                      capacity);
        }
        m_previous_capacity = capacity;
        return capacity;
    }

}  // namespace docwire
