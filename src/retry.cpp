#include "docwire/retry.hpp"

#include <utility>

namespace docwire {

    namespace {
        using Code = Error::Code;

        struct MethodRetry {
            std::string_view method;
            std::vector<Code> codes;
        };

        const std::vector<MethodRetry>& retry_table() {
            static const std::vector<MethodRetry> table = [] {
                const std::vector<Code> idempotent{Code::DeadlineExceeded,
                                                   Code::ResourceExhausted,
                                                   Code::Unavailable};
                const std::vector<Code> idempotent_internal{
                    Code::DeadlineExceeded, Code::ResourceExhausted,
                    Code::Unavailable, Code::Internal};
                const std::vector<Code> mutation{Code::ResourceExhausted,
                                                 Code::Unavailable};

                std::vector<MethodRetry> t;
                for (std::string_view m :
                     {"getDocument", "listDocuments", "beginTransaction",
                      "rollback", "partitionQuery", "listCollectionIds",
                      "runAggregationQuery"}) {
                    t.push_back({m, idempotent});
                }
                for (std::string_view m :
                     {"batchGetDocuments", "runQuery", "listen"}) {
                    t.push_back({m, idempotent_internal});
                }
                for (std::string_view m :
                     {"commit", "createDocument", "updateDocument",
                      "deleteDocument", "write"}) {
                    t.push_back({m, mutation});
                }
                t.push_back({"batchWrite",
                             {Code::Aborted, Code::ResourceExhausted,
                              Code::Unavailable}});
                return t;
            }();
            return table;
        }
    }  // namespace

    std::vector<Error::Code> retry_codes(std::string_view method) {
        for (const auto& entry : retry_table()) {
            if (entry.method == method) return entry.codes;
        }
        return {};
    }

    RetrySettings retry_params(std::string_view method) {
        RetrySettings settings;
        settings.codes = retry_codes(method);
        return settings;
    }

    bool is_permanent_rpc_error(const Error& err, std::string_view method) {
        if (err.code == Error::Code::ClientTerminated) return true;
        const auto codes = retry_codes(method);
        return std::find(codes.begin(), codes.end(), err.code) == codes.end();
    }

}  // namespace docwire
