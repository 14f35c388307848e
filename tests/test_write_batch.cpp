#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <sstream>

#include "docwire/rpc/rpc_client.hpp"
#include "docwire/write/write_batch.hpp"
#include "fake_channel.hpp"
#include "test_support.hpp"

using namespace docwire;

namespace {

    /// Encodes writes as "kind:path" lines; decodes one status code per
    /// line of the response ("0" is success).
    class LineCodec : public WriteCodec {
       public:
        Result<std::string> encode_batch_write(
            const std::string& database_path,
            const std::vector<PendingWrite>& writes) const override {
            std::string out = database_path;
            for (const auto& w : writes) {
                out += "\n";
                out += to_string(w.kind);
                out += ":" + w.ref.path;
            }
            return Result<std::string>::ok(std::move(out));
        }

        Result<std::vector<BatchWriteResult>> decode_batch_write(
            const std::string& response,
            const std::vector<PendingWrite>&) const override {
            std::vector<BatchWriteResult> results;
            std::istringstream in(response);
            int code = 0;
            while (in >> code) {
                BatchWriteResult r;
                r.status.code = static_cast<Error::Code>(code);
                if (code == 0) r.write_time = Timestamp{100, 0};
                results.push_back(r);
            }
            return Result<std::vector<BatchWriteResult>>::ok(std::move(results));
        }
    };

    class RecordingBatch : public WriteBatch {
       public:
        boost::asio::awaitable<Result<std::vector<BatchWriteResult>>>
        bulk_commit(std::string) override {
            co_return Result<std::vector<BatchWriteResult>>::ok(
                std::vector<BatchWriteResult>(m_writes.size()));
        }
    };

    TEST(WriteBatchTest, OperationsCarryTheirPreconditions) {
        RecordingBatch batch;
        batch.create({"users/a"}, "{}");
        batch.set({"users/b"}, "{}", true);
        batch.update({"users/c"}, "{}");
        Precondition at_time;
        at_time.last_update_time = Timestamp{5, 0};
        batch.update({"users/d"}, "{}", at_time);
        batch.remove({"users/e"});

        ASSERT_EQ(batch.op_count(), 5u);
        const auto& w = batch.writes();
        EXPECT_EQ(w[0].kind, WriteKind::Create);
        EXPECT_EQ(w[0].precondition.exists, std::optional<bool>(false));
        EXPECT_TRUE(w[1].merge);
        EXPECT_TRUE(w[1].precondition.empty());
        EXPECT_EQ(w[2].precondition.exists, std::optional<bool>(true));
        EXPECT_FALSE(w[3].precondition.exists.has_value());
        EXPECT_EQ(w[3].precondition.last_update_time, std::optional<Timestamp>(Timestamp{5, 0}));
        EXPECT_EQ(w[4].kind, WriteKind::Delete);
        EXPECT_TRUE(w[4].precondition.empty());
    }

    struct RpcBatchFixture {
        boost::asio::io_context io;
        std::shared_ptr<test::ChannelScript> script =
            std::make_shared<test::ChannelScript>();
        std::shared_ptr<RpcClient> client;

        RpcBatchFixture() {
            RpcClientConfiguration cfg;
            cfg.project_id = "p";
            client = std::make_shared<RpcClient>(
                io.get_executor(), cfg, test::fake_channel_factory(script));
        }

        RpcWriteBatch make_batch() {
            return RpcWriteBatch(client, std::make_shared<LineCodec>());
        }
    };

    TEST(RpcWriteBatchTest, CommitsThroughBatchWrite) {
        RpcBatchFixture f;
        f.script->on_unary = [](const test::ChannelScript::Call&) {
            return Result<std::string>::ok("0 6");
        };
        auto batch = f.make_batch();
        batch.set({"users/a"}, "{}");
        batch.create({"users/b"}, "{}");

        auto results = test::await_result(f.io, batch.bulk_commit("tag01"));
        ASSERT_TRUE(results.has_value());
        ASSERT_EQ(results.value().size(), 2u);
        EXPECT_EQ(results.value()[0].write_time, std::optional<Timestamp>(Timestamp{100, 0}));
        EXPECT_EQ(results.value()[1].status.code, Error::Code::AlreadyExists);

        ASSERT_EQ(f.script->unary_calls.size(), 1u);
        const auto& call = f.script->unary_calls[0];
        EXPECT_EQ(call.method, "batchWrite");
        EXPECT_EQ(*call.request,
                  "projects/p/databases/(default)\nset:users/a\ncreate:users/b");
        ASSERT_TRUE(call.options.retry.has_value());
        EXPECT_TRUE(call.options.retry->retries(Error::Code::Aborted));
    }

    TEST(RpcWriteBatchTest, ResultCountMismatchIsInternal) {
        RpcBatchFixture f;
        f.script->on_unary = [](const test::ChannelScript::Call&) {
            return Result<std::string>::ok("0");
        };
        auto batch = f.make_batch();
        batch.set({"users/a"}, "{}");
        batch.set({"users/b"}, "{}");

        auto results = test::await_result(f.io, batch.bulk_commit("tag02"));
        ASSERT_TRUE(results.has_error());
        EXPECT_EQ(results.error().code, Error::Code::Internal);
    }

    TEST(RpcWriteBatchTest, RequestErrorFailsTheWholeBatch) {
        RpcBatchFixture f;
        f.script->on_unary = [](const test::ChannelScript::Call&) {
            return Result<std::string>::err(
                Error{Error::Code::PermissionDenied, "no access"});
        };
        auto batch = f.make_batch();
        batch.remove({"users/a"});

        auto results = test::await_result(f.io, batch.bulk_commit("tag03"));
        ASSERT_TRUE(results.has_error());
        EXPECT_EQ(results.error().code, Error::Code::PermissionDenied);
    }

}  // namespace
