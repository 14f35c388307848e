#include "docwire/write/bulk_writer.hpp"

#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cmath>
#include <numeric>
#include <stdexcept>

#include "docwire/backoff.hpp"
#include "docwire/logging.hpp"
#include "docwire/retry.hpp"

namespace docwire {

    namespace {
        constexpr double kRateLimiterMultiplier = 1.5;
        constexpr std::chrono::milliseconds kRateLimiterMultiplierPeriod{
            5 * 60 * 1000};
        constexpr const char* kClosedMessage =
            "BulkWriter has already been closed.";

        Result<WriteResult> to_outcome(const BatchWriteResult& r) {
            if (r.write_time) {
                return Result<WriteResult>::ok(WriteResult{*r.write_time});
            }
            if (r.status.code == Error::Code::Ok) {
                return Result<WriteResult>::err(
                    Error{Error::Code::Internal,
                          "Commit returned neither a write time nor an error"});
            }
            return Result<WriteResult>::err(r.status);
        }
    }  // namespace

    std::shared_ptr<BulkWriter> BulkWriter::make(
        boost::asio::any_io_executor ex, BatchFactory factory,
        BulkWriterOptions options) {
        options.validate();
        if (!factory) {
            throw std::invalid_argument("BulkWriter requires a batch factory");
        }
        return std::shared_ptr<BulkWriter>(
            new BulkWriter(std::move(ex), std::move(factory), options));
    }

    BulkWriter::BulkWriter(boost::asio::any_io_executor ex,
                           BatchFactory factory, BulkWriterOptions options)
        : m_ex(std::move(ex)),
          m_factory(std::move(factory)),
          m_max_batch_size(options.max_batch_size),
          m_commit_backoff(options.commit_backoff),
          m_max_commit_attempts(options.max_commit_attempts) {
        if (!options.throttling.enabled) return;

        const double max_rate = options.throttling.max_ops_per_second;
        const double starting_rate =
            std::min(options.throttling.initial_ops_per_second, max_rate);
        if (starting_rate < static_cast<double>(m_max_batch_size)) {
            m_max_batch_size = std::max<std::size_t>(
                1, static_cast<std::size_t>(std::floor(starting_rate)));
        }
        m_rate_limiter.emplace(starting_rate, kRateLimiterMultiplier,
                               kRateLimiterMultiplierPeriod, max_rate);
    }

    WriteFuture BulkWriter::create(DocumentRef ref, std::string data) {
        PendingWrite write{WriteKind::Create, std::move(ref), std::move(data)};
        write.precondition.exists = false;
        return enqueue_new(std::move(write));
    }

    WriteFuture BulkWriter::set(DocumentRef ref, std::string data, bool merge) {
        PendingWrite write{WriteKind::Set, std::move(ref), std::move(data)};
        write.merge = merge;
        return enqueue_new(std::move(write));
    }

    WriteFuture BulkWriter::update(DocumentRef ref, std::string data,
                                   Precondition precondition) {
        if (precondition.empty()) precondition.exists = true;
        PendingWrite write{WriteKind::Update, std::move(ref), std::move(data)};
        write.precondition = std::move(precondition);
        return enqueue_new(std::move(write));
    }

    WriteFuture BulkWriter::remove(DocumentRef ref, Precondition precondition) {
        PendingWrite write{WriteKind::Delete, std::move(ref), {}};
        write.precondition = std::move(precondition);
        return enqueue_new(std::move(write));
    }

    std::vector<std::size_t> BulkWriter::queued_batch_sizes() const {
        std::vector<std::size_t> sizes;
        sizes.reserve(m_queue.size());
        for (const auto& batch : m_queue) sizes.push_back(batch->ops.size());
        return sizes;
    }

    WriteFuture BulkWriter::enqueue_new(PendingWrite write) {
        auto state = WriteFuture::State::make(m_ex);
        WriteFuture future(state);

        if (m_close_called) {
            state->set(Result<WriteResult>::err(
                Error{Error::Code::FailedPrecondition, kClosedMessage}));
            return future;
        }

        enqueue(std::move(write), 0, std::move(state));
        m_operations.push_back(future);
        send_ready_batches();
        return future;
    }

    BulkWriter::Batch& BulkWriter::enqueue(
        PendingWrite write, std::size_t retry_count,
        std::shared_ptr<WriteFuture::State> result) {
        Batch& batch = get_eligible_batch(write.ref);

        batch.batch->add(write);
        batch.refs.insert(write.ref);
        batch.ops.push_back(PendingOp{batch.ops.size() + 1, std::move(write),
                                      retry_count, std::move(result)});

        if (batch.ops.size() >= m_max_batch_size) {
            batch.state = BatchState::ReadyToSend;
        }
        return batch;
    }

    BulkWriter::Batch& BulkWriter::get_eligible_batch(const DocumentRef& ref) {
        bool held_back_by_ref = false;
        for (const auto& batch : m_queue) {
            if (batch->state == BatchState::Sent ||
                batch->ops.size() >= m_max_batch_size) {
                continue;
            }
            if (batch->refs.count(ref) != 0) {
                held_back_by_ref = true;
                continue;
            }
            return *batch;
        }

        if (held_back_by_ref) {
            log_warn("BulkWriter.get_eligible_batch", {},
                     "Writing to the same document ({}) more than once in "
                     "a short period reduces BulkWriter throughput",
                     ref.path);
        }
        return create_new_batch();
    }

    BulkWriter::Batch& BulkWriter::create_new_batch() {
        auto batch = std::make_shared<Batch>();
        batch->id = m_next_batch_id;
        m_next_batch_id = next_batch_id(m_next_batch_id);
        batch->batch = m_factory();
        if (!batch->batch) {
            throw std::logic_error("The batch factory returned a null batch");
        }
        batch->completion = Signal::make(m_ex);

        if (!m_queue.empty()) m_queue.back()->mark_ready();
        m_queue.push_back(batch);
        return *batch;
    }

    void BulkWriter::send_ready_batches() {
        while (!m_queue.empty()) {
            auto batch = m_queue.front();
            if (batch->state != BatchState::ReadyToSend) return;

            for (const auto& ref : batch->refs) {
                if (m_refs_in_flight.count(ref) != 0) return;
            }

            if (m_rate_limiter) {
                const std::size_t n = batch->ops.size();
                auto delay = m_rate_limiter->next_request_delay(n);
                if (!delay) {
                    log_warn("BulkWriter.send_ready_batches", {},
                             "Batch {} with {} writes exceeds the rate limit "
                             "capacity",
                             batch->id, n);
                } else if (delay->count() > 0) {
                    schedule_send(*delay);
                    return;
                } else {
                    m_rate_limiter->try_make_request(n);
                }
            }

            send_batch(std::move(batch));
        }
    }

    void BulkWriter::send_batch(std::shared_ptr<Batch> batch) {
        m_queue.pop_front();
        batch->state = BatchState::Sent;
        m_refs_in_flight.insert(batch->refs.begin(), batch->refs.end());
        m_in_flight.push_back(batch);

        boost::asio::co_spawn(m_ex, run_batch(shared_from_this(), std::move(batch)),
                              boost::asio::detached);
    }

    void BulkWriter::schedule_send(std::chrono::milliseconds delay) {
        if (m_send_scheduled) return;
        m_send_scheduled = true;

        boost::asio::co_spawn(
            m_ex,
            [weak = weak_from_this(), ex = m_ex,
             delay]() -> boost::asio::awaitable<void> {
                boost::asio::steady_timer timer(ex, delay);
                boost::system::error_code ec;
                co_await timer.async_wait(
                    boost::asio::redirect_error(boost::asio::use_awaitable, ec));
                if (auto self = weak.lock()) {
                    self->m_send_scheduled = false;
                    self->send_ready_batches();
                }
            },
            boost::asio::detached);
    }

    boost::asio::awaitable<void> BulkWriter::run_batch(
        std::shared_ptr<BulkWriter> self, std::shared_ptr<Batch> batch) {
        const std::string tag = make_request_tag();
        log_debug("BulkWriter.run_batch", tag, "Sending batch {} with {} writes",
                  batch->id, batch->ops.size());

        const std::vector<Error::Code> retryable = retry_codes("batchWrite");
        ExponentialBackoff backoff(self->m_commit_backoff);

        // Indices into batch->ops of the writes still held by batch->batch,
        // in the same order.
        std::vector<std::size_t> pending(batch->ops.size());
        std::iota(pending.begin(), pending.end(), std::size_t{0});

        for (std::size_t attempt = 0; !pending.empty(); ++attempt) {
            if (attempt > 0) {
                auto waited = co_await backoff.backoff_and_wait();
                if (waited.has_error()) {
                    for (std::size_t i : pending) {
                        self->settle(batch->ops[i],
                                     Result<WriteResult>::err(waited.error()));
                    }
                    break;
                }
            }

            auto results = co_await batch->batch->bulk_commit(tag);
            if (results.has_value() && results.value().size() != pending.size()) {
                results = Result<std::vector<BatchWriteResult>>::err(
                    Error{Error::Code::Internal,
                          "Commit returned a result count that does not match "
                          "the batch"});
            }
            if (results.has_error()) {
                log_debug("BulkWriter.run_batch", tag, "Batch {} failed: {}",
                          batch->id, results.error().message);
            }

            const bool last_attempt = attempt + 1 >= self->m_max_commit_attempts;
            std::vector<std::size_t> retry_positions;
            std::vector<std::size_t> still_pending;
            bool resource_exhausted = false;

            for (std::size_t j = 0; j < pending.size(); ++j) {
                auto outcome = results.has_error()
                                   ? Result<WriteResult>::err(results.error())
                                   : to_outcome(results.value()[j]);
                if (outcome.has_error() && !last_attempt &&
                    std::find(retryable.begin(), retryable.end(),
                              outcome.error().code) != retryable.end()) {
                    if (outcome.error().code == Error::Code::ResourceExhausted) {
                        resource_exhausted = true;
                    }
                    retry_positions.push_back(j);
                    still_pending.push_back(pending[j]);
                    continue;
                }
                self->settle(batch->ops[pending[j]], std::move(outcome));
            }

            if (!still_pending.empty()) {
                log_debug("BulkWriter.run_batch", tag,
                          "Batch {} failed at attempt #{}. Num failures: {}.",
                          batch->id, attempt, still_pending.size());
                batch->batch->retain(retry_positions);
                if (resource_exhausted) backoff.reset_to_max();
            }
            pending = std::move(still_pending);
        }

        for (const auto& ref : batch->refs) self->m_refs_in_flight.erase(ref);
        auto& in_flight = self->m_in_flight;
        in_flight.erase(std::remove(in_flight.begin(), in_flight.end(), batch),
                        in_flight.end());

        auto& operations = self->m_operations;
        operations.erase(
            std::remove_if(operations.begin(), operations.end(),
                           [](const WriteFuture& f) { return f.ready(); }),
            operations.end());

        batch->completion->set();
        self->send_ready_batches();
    }

    void BulkWriter::settle(PendingOp& op, Result<WriteResult> outcome) {
        if (outcome.has_value()) {
            if (m_success_fn) m_success_fn(op.write.ref, outcome.value());
            op.result->set(std::move(outcome));
            return;
        }

        BulkWriterError error{outcome.error().code, outcome.error().message,
                              op.write.ref, op.write.kind, op.retry_count};
        if (m_error_fn && m_error_fn(error)) {
            log_debug("BulkWriter.settle", {},
                      "Retrying {} of {} (retry #{}) after {}",
                      to_string(op.write.kind), op.write.ref.path,
                      op.retry_count + 1, to_string(error.code));
            Batch& retry =
                enqueue(std::move(op.write), op.retry_count + 1, op.result);
            retry.mark_ready();
            return;
        }
        op.result->set(std::move(outcome));
    }

    boost::asio::awaitable<void> BulkWriter::wait_for_pending_writes() {
        auto self = shared_from_this();

        std::vector<std::shared_ptr<Signal>> pending;
        for (const auto& batch : m_queue) {
            batch->mark_ready();
            pending.push_back(batch->completion);
        }
        for (const auto& batch : m_in_flight) {
            pending.push_back(batch->completion);
        }

        send_ready_batches();
        for (const auto& signal : pending) co_await signal->wait();
    }

    boost::asio::awaitable<void> BulkWriter::flush_pending() {
        auto self = shared_from_this();
        const std::vector<WriteFuture> operations = m_operations;

        co_await wait_for_pending_writes();
        for (const auto& op : operations) {
            static_cast<void>(co_await op.get());
        }
    }

    boost::asio::awaitable<Result<void>> BulkWriter::flush() {
        if (m_close_called) {
            co_return Result<void>::err(
                Error{Error::Code::FailedPrecondition, kClosedMessage});
        }
        co_await flush_pending();
        co_return Result<void>::ok();
    }

    boost::asio::awaitable<Result<void>> BulkWriter::close() {
        if (m_close_called) {
            co_return Result<void>::err(
                Error{Error::Code::FailedPrecondition, kClosedMessage});
        }
        m_close_called = true;
        co_await flush_pending();
        co_return Result<void>::ok();
    }

}  // namespace docwire
