#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "docwire/result.hpp"
#include "docwire/write/types.hpp"

namespace docwire {

    class RpcClient;

    /**
     * @brief An ordered group of writes committed in one request.
     *
     * Subclasses decide how the group is committed; bulk_commit() returns
     * one BatchWriteResult per write, in the order the writes were added.
     * A failed Result means the whole request failed.
     */
    class WriteBatch {
       public:
        virtual ~WriteBatch() = default;

        void create(DocumentRef ref, std::string data);

        void set(DocumentRef ref, std::string data, bool merge = false);

        /// @brief Without a precondition the document must exist.
        void update(DocumentRef ref, std::string data,
                    Precondition precondition = {});

        void remove(DocumentRef ref, Precondition precondition = {});

        /// @brief Append an already built write (used when re-queueing).
        void add(PendingWrite write) { m_writes.push_back(std::move(write)); }

        /// @brief Keep only the writes at `indices` (ascending), dropping
        /// the rest. Used to resend the writes that failed.
        void retain(const std::vector<std::size_t>& indices);

        std::size_t op_count() const noexcept { return m_writes.size(); }

        const std::vector<PendingWrite>& writes() const noexcept {
            return m_writes;
        }

        virtual boost::asio::awaitable<Result<std::vector<BatchWriteResult>>>
        bulk_commit(std::string tag) = 0;

       protected:
        std::vector<PendingWrite> m_writes;
    };

    /**
     * @brief Wire format of a batchWrite request and response.
     */
    class WriteCodec {
       public:
        virtual ~WriteCodec() = default;

        virtual Result<std::string> encode_batch_write(
            const std::string& database_path,
            const std::vector<PendingWrite>& writes) const = 0;

        virtual Result<std::vector<BatchWriteResult>> decode_batch_write(
            const std::string& response,
            const std::vector<PendingWrite>& writes) const = 0;
    };

    /**
     * @brief WriteBatch committed through RpcClient's "batchWrite" method,
     * retrying the codes batchWrite treats as transient.
     */
    class RpcWriteBatch : public WriteBatch {
       public:
        RpcWriteBatch(std::shared_ptr<RpcClient> client,
                      std::shared_ptr<const WriteCodec> codec)
            : m_client(std::move(client)), m_codec(std::move(codec)) {}

        boost::asio::awaitable<Result<std::vector<BatchWriteResult>>>
        bulk_commit(std::string tag) override;

       private:
        std::shared_ptr<RpcClient> m_client;
        std::shared_ptr<const WriteCodec> m_codec;
    };

}  // namespace docwire
