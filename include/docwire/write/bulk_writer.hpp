#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "docwire/config.hpp"
#include "docwire/deferred.hpp"
#include "docwire/result.hpp"
#include "docwire/write/rate_limiter.hpp"
#include "docwire/write/types.hpp"
#include "docwire/write/write_batch.hpp"

namespace docwire {

    /**
     * @brief Handle on the outcome of one BulkWriter operation.
     */
    class WriteFuture {
       public:
        using State = Deferred<Result<WriteResult>>;

        explicit WriteFuture(std::shared_ptr<State> state)
            : m_state(std::move(state)) {}

        /// @brief Suspend until the operation (including any retries) has
        /// settled.
        boost::asio::awaitable<Result<WriteResult>> get() const {
            auto state = m_state;
            co_return co_await state->wait();
        }

        bool ready() const noexcept { return m_state->ready(); }

        /// @brief The outcome, or nullptr while pending.
        const Result<WriteResult>* peek() const noexcept {
            return m_state->peek();
        }

       private:
        std::shared_ptr<State> m_state;
    };

    /**
     * Groups individual writes into batches and commits them in parallel.
     *
     * - A batch holds at most `max_batch_size` writes and at most one
     *   write per document.
     * - Batches are dispatched in creation order, once full or flushed.
     *   A batch touching a document that is still being written waits, and
     *   so does every batch behind it.
     * - Writes failing with a code batchWrite retries are resent with
     *   backoff, up to `max_commit_attempts` commits per batch, before
     *   they are reported.
     * - With throttling, dispatch follows a 500/50/5 ramp-up: the allowed
     *   rate starts at `initial_ops_per_second` and grows by 50% every
     *   five minutes.
     *
     * SAFETY:
     * - Not thread-safe. Use from the thread running the executor.
     * - Create through make(); in-flight batches keep the writer alive.
     */
    class BulkWriter : public std::enable_shared_from_this<BulkWriter> {
       public:
        using BatchFactory = std::function<std::unique_ptr<WriteBatch>()>;
        using SuccessCallback =
            std::function<void(const DocumentRef&, const WriteResult&)>;
        /// Return true to retry the failed operation.
        using ErrorCallback = std::function<bool(const BulkWriterError&)>;

        /// @brief Batch ids wrap to 0 after this value (2^53 - 1).
        static constexpr std::uint64_t kMaxBatchId = (1ULL << 53) - 1;

        /// @brief The id following `id`.
        static std::uint64_t next_batch_id(std::uint64_t id) noexcept {
            return id >= kMaxBatchId ? 0 : id + 1;
        }

        /// @throws std::invalid_argument if `options` are inconsistent.
        static std::shared_ptr<BulkWriter> make(
            boost::asio::any_io_executor ex, BatchFactory factory,
            BulkWriterOptions options = {});

        BulkWriter(const BulkWriter&) = delete;
        BulkWriter& operator=(const BulkWriter&) = delete;

        /// @brief Create a document that must not exist yet.
        WriteFuture create(DocumentRef ref, std::string data);

        /// @brief Overwrite (or with `merge`, patch) a document.
        WriteFuture set(DocumentRef ref, std::string data, bool merge = false);

        /// @brief Update fields of an existing document.
        WriteFuture update(DocumentRef ref, std::string data,
                           Precondition precondition = {});

        /// @brief Delete a document.
        WriteFuture remove(DocumentRef ref, Precondition precondition = {});

        /// @brief Called for every successful write. Must not throw.
        void on_write_result(SuccessCallback callback) {
            m_success_fn = std::move(callback);
        }

        /// @brief Called for every failed write; returning true retries it.
        /// Must not throw.
        void on_write_error(ErrorCallback callback) {
            m_error_fn = std::move(callback);
        }

        /**
         * @brief Send every queued batch and wait until the batches queued
         * or in flight at the time of the call have been committed.
         */
        boost::asio::awaitable<void> wait_for_pending_writes();

        /**
         * @brief Commit everything enqueued so far and wait until each of
         * those operations has settled, retries included.
         * @return FailedPrecondition once close() has been called.
         */
        boost::asio::awaitable<Result<void>> flush();

        /**
         * @brief Flush, then reject every further write.
         * @return FailedPrecondition if already closed.
         */
        boost::asio::awaitable<Result<void>> close();

        bool closed() const noexcept { return m_close_called; }

        std::size_t max_batch_size() const noexcept { return m_max_batch_size; }

        /// @brief Batches created but not yet dispatched.
        std::size_t queued_batch_count() const noexcept {
            return m_queue.size();
        }

        /// @brief Number of writes per queued batch, oldest first.
        std::vector<std::size_t> queued_batch_sizes() const;

        std::size_t in_flight_batch_count() const noexcept {
            return m_in_flight.size();
        }

        /// @brief Operations whose outcome is not known yet.
        std::size_t pending_operation_count() const noexcept {
            return m_operations.size();
        }

        bool is_in_flight(const DocumentRef& ref) const {
            return m_refs_in_flight.count(ref) != 0;
        }

        std::size_t refs_in_flight_count() const noexcept {
            return m_refs_in_flight.size();
        }

        const RateLimiter* rate_limiter() const noexcept {
            return m_rate_limiter ? &*m_rate_limiter : nullptr;
        }

       private:
        enum class BatchState : std::uint8_t { Open, ReadyToSend, Sent };

        struct PendingOp {
            std::size_t index;  // 1-based position in the commit
            PendingWrite write;
            std::size_t retry_count;
            std::shared_ptr<WriteFuture::State> result;
        };

        struct Batch {
            std::uint64_t id{0};
            BatchState state{BatchState::Open};
            std::unordered_set<DocumentRef> refs;
            std::vector<PendingOp> ops;
            std::unique_ptr<WriteBatch> batch;
            std::shared_ptr<Signal> completion;

            void mark_ready() {
                if (state == BatchState::Open) state = BatchState::ReadyToSend;
            }
        };

        BulkWriter(boost::asio::any_io_executor ex, BatchFactory factory,
                   BulkWriterOptions options);

        WriteFuture enqueue_new(PendingWrite write);

        /// Add `write` to an eligible batch; returns that batch.
        Batch& enqueue(PendingWrite write, std::size_t retry_count,
                       std::shared_ptr<WriteFuture::State> result);

        Batch& get_eligible_batch(const DocumentRef& ref);

        Batch& create_new_batch();

        void send_ready_batches();

        void send_batch(std::shared_ptr<Batch> batch);

        void schedule_send(std::chrono::milliseconds delay);

        static boost::asio::awaitable<void> run_batch(
            std::shared_ptr<BulkWriter> self, std::shared_ptr<Batch> batch);

        void settle(PendingOp& op, Result<WriteResult> outcome);

        boost::asio::awaitable<void> flush_pending();

        boost::asio::any_io_executor m_ex;
        BatchFactory m_factory;
        std::size_t m_max_batch_size;
        BackoffSettings m_commit_backoff;
        std::size_t m_max_commit_attempts;
        std::optional<RateLimiter> m_rate_limiter;

        std::list<std::shared_ptr<Batch>> m_queue;
        std::vector<std::shared_ptr<Batch>> m_in_flight;
        std::unordered_set<DocumentRef> m_refs_in_flight;
        std::uint64_t m_next_batch_id{0};

        // Unsettled operations, pruned as batches complete.
        std::vector<WriteFuture> m_operations;
        SuccessCallback m_success_fn;
        ErrorCallback m_error_fn;

        bool m_send_scheduled{false};
        bool m_close_called{false};
    };

}  // namespace docwire
