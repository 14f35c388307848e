#pragma once

#include <algorithm>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "docwire/config.hpp"
#include "docwire/deferred.hpp"
#include "docwire/error.hpp"
#include "docwire/logging.hpp"
#include "docwire/pool/resource_pool_types.hpp"
#include "docwire/result.hpp"

namespace docwire {

    /**
     * Pool of backend clients shared by concurrent operations.
     *
     * Each client carries up to `concurrent_operation_limit` operations.
     * run() bin-packs: it picks the busiest client that still has room and
     * only creates a new one when every client is full. Idle clients are
     * destroyed once the pool holds more spare capacity than
     * `max_idle_clients` whole clients.
     *
     * SAFETY:
     * - Not thread-safe. All calls happen on the thread running the
     *   executor; state changes only between suspension points.
     * - The pool must outlive every run() and terminate() coroutine.
     *
     * INVARIANTS:
     * 1. 0 <= active(client) <= concurrent_operation_limit
     * 2. A failed client is never selected again
     * 3. After terminate() no client is created and run() fails fast
     * 4. The termination signal fires once terminated && op_count() == 0
     *
     * ERRORS:
     * - ClientTerminated: run() called after terminate()
     * - std::logic_error: the factory returned null or an instance the pool
     *   already tracks
     * - Exceptions thrown by an operation propagate after its client has
     *   been released
     */
    template <typename T>
    class ResourcePool {
       public:
        using Factory = std::function<std::shared_ptr<T>()>;
        using Destructor = std::function<boost::asio::awaitable<Result<void>>(
            std::shared_ptr<T>)>;
        using FailurePredicate = std::function<bool(const Error&)>;

        /**
         * @brief Constructs a ResourcePool.
         * @param ex Executor used for the termination signal.
         * @param cfg Concurrency limit and idle capacity.
         * @param factory Creates a new client.
         * @param destructor Disposes of a client. Defaults to a no-op.
         * @param is_fatal Marks a client as failed when an operation on it
         * returns a matching error. Defaults to is_rst_stream_error.
         */
        ResourcePool(boost::asio::any_io_executor ex,
                     ResourcePoolConfiguration cfg, Factory factory,
                     Destructor destructor = {},
                     FailurePredicate is_fatal = &is_rst_stream_error)
            : m_cfg(cfg),
              m_factory(std::move(factory)),
              m_destructor(std::move(destructor)),
              m_is_fatal(std::move(is_fatal)),
              m_termination(Signal::make(std::move(ex))) {
            if (m_cfg.concurrent_operation_limit == 0) {
                throw std::invalid_argument(
                    "concurrent_operation_limit must be at least 1");
            }
            if (!m_factory) {
                throw std::invalid_argument("ResourcePool requires a factory");
            }
            if (!m_destructor) {
                m_destructor = [](std::shared_ptr<T>)
                    -> boost::asio::awaitable<Result<void>> {
                    co_return Result<void>::ok();
                };
            }
        }

        ResourcePool(const ResourcePool&) = delete;
        ResourcePool& operator=(const ResourcePool&) = delete;

        /**
         * @brief Run `op` on a pooled client.
         *
         * @param tag Request tag used in log lines.
         * @param op Callable `(T&) -> awaitable<Result<U>>`.
         * @return Exactly what `op` produced, or ClientTerminated if the
         * pool has been terminated.
         *
         * The client is released (and possibly destroyed) before this
         * coroutine completes, whether `op` succeeded, failed or threw.
         */
        template <typename Op>
        auto run(std::string tag, Op op) -> std::invoke_result_t<Op&, T&> {
            using R = typename std::invoke_result_t<Op&, T&>::value_type;

            if (m_terminated) {
                ++m_metrics.operations_rejected;
                co_return R::err(client_terminated_error());
            }

            std::shared_ptr<Entry> entry = acquire(tag);
            ++entry->active;
            ++m_metrics.operations_run;

            std::optional<R> result;
            std::exception_ptr failure;
            try {
                result.emplace(co_await op(*entry->client));
            } catch (...) {
                failure = std::current_exception();
            }

            if (result && result->has_error() && m_is_fatal &&
                m_is_fatal(result->error()) && !entry->failed) {
                log_debug("ResourcePool.run", tag,
                          "Marking client as failed: {}",
                          result->error().message);
                entry->failed = true;
                ++m_metrics.clients_failed;
            }

            co_await release(tag, entry);

            if (failure) std::rethrow_exception(failure);
            co_return std::move(*result);
        }

        /**
         * @brief Stop accepting operations, wait for outstanding ones and
         * destroy every client.
         * @return The first destructor error, if any. Every client is
         * destroyed regardless.
         */
        boost::asio::awaitable<Result<void>> terminate() {
            m_terminated = true;

            if (op_count() > 0) {
                log_debug("ResourcePool.terminate", {},
                          "Waiting for {} pending operations to complete "
                          "before terminating",
                          op_count());
                co_await m_termination->wait();
            }

            std::vector<std::shared_ptr<Entry>> entries;
            entries.swap(m_entries);

            Result<void> outcome = Result<void>::ok();
            for (auto& entry : entries) {
                auto destroyed = co_await destroy(entry->client);
                if (destroyed.has_error() && outcome.has_value()) {
                    outcome = std::move(destroyed);
                }
            }
            co_return outcome;
        }

        /// @brief Number of clients currently alive.
        std::size_t size() const noexcept { return m_entries.size(); }

        /// @brief Number of operations currently running.
        std::size_t op_count() const noexcept {
            std::size_t count = 0;
            for (const auto& e : m_entries) count += e->active;
            return count;
        }

        bool terminated() const noexcept { return m_terminated; }

        const ResourcePoolConfiguration& config() const noexcept {
            return m_cfg;
        }

        const ResourcePoolMetrics& metrics() const noexcept {
            return m_metrics;
        }

       private:
        struct Entry {
            std::shared_ptr<T> client;
            std::size_t active{0};
            bool failed{false};
        };

        std::shared_ptr<Entry> acquire(const std::string& tag) {
            std::shared_ptr<Entry> selected;
            for (const auto& e : m_entries) {
                if (e->failed ||
                    e->active >= m_cfg.concurrent_operation_limit) {
                    continue;
                }
                if (!selected || e->active > selected->active) selected = e;
            }

            if (selected) {
                log_debug("ResourcePool.acquire", tag,
                          "Re-using existing client with {} remaining "
                          "operations",
                          m_cfg.concurrent_operation_limit - selected->active);
                return selected;
            }

            log_debug("ResourcePool.acquire", tag, "Creating a new client");
            std::shared_ptr<T> client = m_factory();
            if (!client) {
                throw std::logic_error(
                    "The provided client factory returned a null client");
            }
            for (const auto& e : m_entries) {
                if (e->client == client) {
                    throw std::logic_error(
                        "The provided client factory returned an existing "
                        "instance");
                }
            }
            ++m_metrics.clients_created;

            auto entry = std::make_shared<Entry>();
            entry->client = std::move(client);
            m_entries.push_back(entry);
            return entry;
        }

        boost::asio::awaitable<void> release(const std::string& tag,
                                             std::shared_ptr<Entry> entry) {
            --entry->active;

            if (m_terminated && op_count() == 0) m_termination->set();

            if (!should_garbage_collect(*entry)) co_return;

            auto it = std::find(m_entries.begin(), m_entries.end(), entry);
            if (it == m_entries.end()) co_return;
            m_entries.erase(it);

            log_debug("ResourcePool.release", tag,
                      "Garbage collecting client ({} remaining)",
                      m_entries.size());
            static_cast<void>(co_await destroy(entry->client));
        }

        bool should_garbage_collect(const Entry& entry) const {
            if (entry.active != 0) return false;
            if (entry.failed) return true;

            std::size_t idle_capacity = 0;
            for (const auto& e : m_entries) {
                idle_capacity += m_cfg.concurrent_operation_limit - e->active;
            }
            return idle_capacity >
                   m_cfg.max_idle_clients * m_cfg.concurrent_operation_limit;
        }

        /// Destructor errors are counted and logged; the client is gone
        /// either way.
        boost::asio::awaitable<Result<void>> destroy(
            std::shared_ptr<T> client) {
            ++m_metrics.clients_destroyed;
            auto result = co_await m_destructor(std::move(client));
            if (result.has_error()) {
                ++m_metrics.destructor_failures;
                log_warn("ResourcePool.destroy", {},
                         "Client destructor failed ({}): {}",
                         to_string(result.error().code),
                         result.error().message);
            }
            co_return result;
        }

        ResourcePoolConfiguration m_cfg;
        Factory m_factory;
        Destructor m_destructor;
        FailurePredicate m_is_fatal;

        std::vector<std::shared_ptr<Entry>> m_entries;
        bool m_terminated{false};
        std::shared_ptr<Signal> m_termination;
        ResourcePoolMetrics m_metrics;
    };

}  // namespace docwire
