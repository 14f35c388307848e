#include "docwire/write/write_batch.hpp"

#include "docwire/logging.hpp"
#include "docwire/retry.hpp"
#include "docwire/rpc/rpc_client.hpp"

namespace docwire {

    void WriteBatch::create(DocumentRef ref, std::string data) {
        PendingWrite write{WriteKind::Create, std::move(ref), std::move(data)};
        write.precondition.exists = false;
        add(std::move(write));
    }

    void WriteBatch::set(DocumentRef ref, std::string data, bool merge) {
        PendingWrite write{WriteKind::Set, std::move(ref), std::move(data)};
        write.merge = merge;
        add(std::move(write));
    }

    void WriteBatch::update(DocumentRef ref, std::string data,
                            Precondition precondition) {
        if (precondition.empty()) precondition.exists = true;
        PendingWrite write{WriteKind::Update, std::move(ref), std::move(data)};
        write.precondition = std::move(precondition);
        add(std::move(write));
    }

    void WriteBatch::remove(DocumentRef ref, Precondition precondition) {
        PendingWrite write{WriteKind::Delete, std::move(ref), {}};
        write.precondition = std::move(precondition);
        add(std::move(write));
    }

    void WriteBatch::retain(const std::vector<std::size_t>& indices) {
        std::vector<PendingWrite> kept;
        kept.reserve(indices.size());
        for (std::size_t i : indices) kept.push_back(std::move(m_writes.at(i)));
        m_writes = std::move(kept);
    }

    boost::asio::awaitable<Result<std::vector<BatchWriteResult>>>
    RpcWriteBatch::bulk_commit(std::string tag) {
        using R = Result<std::vector<BatchWriteResult>>;

        auto request =
            m_codec->encode_batch_write(m_client->database_path(), m_writes);
        if (request.has_error()) co_return request.forward_error<std::vector<BatchWriteResult>>();

        log_debug("WriteBatch.bulk_commit", tag, "Sending {} writes",
                  m_writes.size());
        auto response =
            co_await m_client->unary_call("batchWrite", std::move(request).value(),
                                          tag, retry_codes("batchWrite"));
        if (response.has_error()) co_return response.forward_error<std::vector<BatchWriteResult>>();

        auto results = m_codec->decode_batch_write(response.value(), m_writes);
        if (results.has_error()) co_return results;

        if (results.value().size() != m_writes.size()) {
            co_return R::err(Error{
                Error::Code::Internal,
                "batchWrite returned " + std::to_string(results.value().size()) +
                    " results for " + std::to_string(m_writes.size()) +
                    " writes"});
        }
        co_return results;
    }

}  // namespace docwire
