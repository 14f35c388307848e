#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "docwire/write/write_batch.hpp"

namespace docwire {

    /**
     * @brief WriteCodec for the REST batchWrite endpoint, built on
     * nlohmann::json.
     *
     * `PendingWrite::data` must hold the JSON text of the document's
     * `fields` map (already in the typed-value encoding).
     */
    class JsonWriteCodec : public WriteCodec {
       public:
        Result<std::string> encode_batch_write(
            const std::string& database_path,
            const std::vector<PendingWrite>& writes) const override {
            nlohmann::json body;
            auto& out = body["writes"];
            out = nlohmann::json::array();

            for (const auto& write : writes) {
                const std::string name =
                    database_path + "/documents/" + write.ref.path;
                nlohmann::json w;

                if (write.kind == WriteKind::Delete) {
                    w["delete"] = name;
                } else {
                    nlohmann::json fields = nlohmann::json::object();
                    if (!write.data.empty()) {
                        fields = nlohmann::json::parse(write.data, nullptr, false);
                        if (fields.is_discarded() || !fields.is_object()) {
                            return Result<std::string>::err(
                                Error{Error::Code::InvalidArgument,
                                      "Document data for " + write.ref.path +
                                          " is not a JSON object"});
                        }
                    }

                    const bool masked = write.kind == WriteKind::Update ||
                                        (write.kind == WriteKind::Set && write.merge);
                    if (masked) {
                        auto paths = nlohmann::json::array();
                        for (const auto& item : fields.items()) {
                            paths.push_back(item.key());
                        }
                        w["updateMask"]["fieldPaths"] = std::move(paths);
                    }
                    w["update"] = {{"name", name}, {"fields", std::move(fields)}};
                }

                if (!write.precondition.empty()) {
                    auto& current = w["currentDocument"];
                    if (write.precondition.exists) {
                        current["exists"] = *write.precondition.exists;
                    } else {
                        current["updateTime"] =
                            to_rfc3339(*write.precondition.last_update_time);
                    }
                }
                out.push_back(std::move(w));
            }
            return Result<std::string>::ok(body.dump());
        }

        Result<std::vector<BatchWriteResult>> decode_batch_write(
            const std::string& response,
            const std::vector<PendingWrite>& writes) const override {
            using R = Result<std::vector<BatchWriteResult>>;

            auto body = nlohmann::json::parse(response, nullptr, false);
            if (body.is_discarded() || !body.is_object()) {
                return R::err(Error{Error::Code::Internal,
                                    "batchWrite response is not a JSON object"});
            }

            const auto results = body.value("writeResults", nlohmann::json::array());
            const auto statuses = body.value("status", nlohmann::json::array());

            std::vector<BatchWriteResult> decoded(writes.size());
            for (std::size_t i = 0; i < writes.size(); ++i) {
                BatchWriteResult& r = decoded[i];
                if (i < statuses.size() && statuses[i].is_object()) {
                    const int code = statuses[i].value("code", 0);
                    r.status.code = code >= 0 && code <= 16
                                        ? static_cast<Error::Code>(code)
                                        : Error::Code::Unknown;
                    r.status.message = statuses[i].value("message", std::string{});
                }
                if (r.status.code != Error::Code::Ok) continue;

                std::string update_time;
                if (i < results.size() && results[i].is_object()) {
                    update_time = results[i].value("updateTime", std::string{});
                }
                if (update_time.empty()) {
                    // Deletes of missing documents carry no update time.
                    r.write_time = Timestamp{};
                    continue;
                }
                auto parsed = parse_rfc3339(update_time);
                if (!parsed) {
                    return R::err(Error{Error::Code::Internal,
                                        "Invalid updateTime: " + update_time});
                }
                r.write_time = *parsed;
            }
            return R::ok(std::move(decoded));
        }
    };

}  // namespace docwire
