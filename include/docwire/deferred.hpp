#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <utility>

namespace docwire {

    /**
     * A value that is produced once and awaited by any number of coroutines.
     *
     * Waiters park on a steady_timer that never expires; set() stores the
     * value and cancels the timer, which wakes every waiter. A value set
     * before anyone waits is returned without suspending.
     *
     * SAFETY:
     * - Not thread-safe. Use from the thread (or strand) running the
     *   executor, like the rest of the library.
     * - Always create through make(); waiters keep the Deferred alive.
     */
    template <typename T>
    class Deferred : public std::enable_shared_from_this<Deferred<T>> {
       public:
        static std::shared_ptr<Deferred> make(boost::asio::any_io_executor ex) {
            return std::shared_ptr<Deferred>(new Deferred(std::move(ex)));
        }

        Deferred(const Deferred&) = delete;
        Deferred& operator=(const Deferred&) = delete;

        /// @brief Store the value and wake all waiters.
        /// @return false if a value had already been set (the new one is
        /// dropped).
        bool set(T value) {
            if (m_value) return false;
            m_value.emplace(std::move(value));
            m_timer.cancel();
            return true;
        }

        bool ready() const noexcept { return m_value.has_value(); }

        /// @brief Peek at the value without waiting.
        const T* peek() const noexcept { return m_value ? &*m_value : nullptr; }

        /// @brief Suspend until set() has been called, then return a copy.
        boost::asio::awaitable<T> wait() {
            auto self = this->shared_from_this();
            while (!self->m_value) {
                boost::system::error_code ec;
                co_await self->m_timer.async_wait(
                    boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            }
            co_return *self->m_value;
        }

        /// @brief Like wait(), but moves the value out. Only for a single
        /// consumer; later readers see a moved-from value.
        boost::asio::awaitable<T> take() {
            auto self = this->shared_from_this();
            while (!self->m_value) {
                boost::system::error_code ec;
                co_await self->m_timer.async_wait(
                    boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            }
            co_return std::move(*self->m_value);
        }

       private:
        explicit Deferred(boost::asio::any_io_executor ex)
            : m_timer(std::move(ex),
                      std::chrono::steady_clock::time_point::max()) {}

        std::optional<T> m_value;
        boost::asio::steady_timer m_timer;
    };

    /// @brief A one-shot signal with no payload (termination, stream
    /// lifetime, batch completion).
    template <>
    class Deferred<void> : public std::enable_shared_from_this<Deferred<void>> {
       public:
        static std::shared_ptr<Deferred> make(boost::asio::any_io_executor ex) {
            return std::shared_ptr<Deferred>(new Deferred(std::move(ex)));
        }

        Deferred(const Deferred&) = delete;
        Deferred& operator=(const Deferred&) = delete;

        bool set() {
            if (m_set) return false;
            m_set = true;
            m_timer.cancel();
            return true;
        }

        bool ready() const noexcept { return m_set; }

        boost::asio::awaitable<void> wait() {
            auto self = shared_from_this();
            while (!self->m_set) {
                boost::system::error_code ec;
                co_await self->m_timer.async_wait(
                    boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            }
        }

       private:
        explicit Deferred(boost::asio::any_io_executor ex)
            : m_timer(std::move(ex),
                      std::chrono::steady_clock::time_point::max()) {}

        bool m_set{false};
        boost::asio::steady_timer m_timer;
    };

    using Signal = Deferred<void>;

}  // namespace docwire
