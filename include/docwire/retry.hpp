#pragma once

#include <algorithm>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "backoff.hpp"
#include "config.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "result.hpp"

namespace docwire {

    /**
     * @brief Retry policy of one RPC method: which codes are transient and
     * how long to wait between attempts.
     */
    struct RetrySettings {
        std::vector<Error::Code> codes;
        BackoffSettings backoff{std::chrono::milliseconds{100}, 1.3,
                                std::chrono::milliseconds{60000}, 0.0};
        std::size_t max_attempts{5};

        bool retries(Error::Code code) const {
            return std::find(codes.begin(), codes.end(), code) != codes.end();
        }
    };

    /// @brief Transient error codes of `method`. Empty for unknown methods.
    std::vector<Error::Code> retry_codes(std::string_view method);

    /// @brief Full retry policy of `method`, carrying retry_codes(method).
    RetrySettings retry_params(std::string_view method);

    /// @brief True if `err` must not be retried for `method`.
    /// ClientTerminated is always permanent.
    bool is_permanent_rpc_error(const Error& err, std::string_view method);

    /**
     * @brief Run `fn` until it succeeds, fails with a code outside
     * `settings.codes`, or `settings.max_attempts` attempts were made.
     *
     * @param fn Callable returning awaitable<Result<T>>. Called once per
     * attempt.
     * @return The last Result produced by `fn`.
     *
     * @note The first attempt is immediate; later ones wait on an
     * ExponentialBackoff built from `settings.backoff`. RESOURCE_EXHAUSTED
     * pushes the next wait to the maximum delay.
     */
    template <typename F>
    auto with_retries(RetrySettings settings, std::string method,
                      std::string tag, F fn) -> std::invoke_result_t<F&> {
        ExponentialBackoff backoff(settings.backoff);
        const std::size_t max_attempts =
            std::max<std::size_t>(settings.max_attempts, 1);

        for (std::size_t attempt = 1;; ++attempt) {
            auto result = co_await fn();
            if (result.has_value()) co_return result;

            const Error& err = result.error();
            if (!settings.retries(err.code) || attempt >= max_attempts) {
                log_debug("with_retries", tag,
                          "{} failed with {}: {}", method, to_string(err.code),
                          err.message);
                co_return result;
            }

            log_debug("with_retries", tag,
                      "Retrying {} (attempt {}) after {}: {}", method,
                      attempt + 1, to_string(err.code), err.message);
            if (err.code == Error::Code::ResourceExhausted) {
                backoff.reset_to_max();
            }
            if (auto waited = co_await backoff.backoff_and_wait(); !waited) {
                co_return result;
            }
        }
    }

}  // namespace docwire
