#include "docwire/config.hpp"

#include <cmath>
#include <cstdlib>
#include <stdexcept>

#include "docwire/logging.hpp"

namespace docwire {

    std::string RpcClientConfiguration::database_path() const {
        return "projects/" + project_id + "/databases/" + database_id;
    }

    bool RpcClientConfiguration::apply_environment() {
        const char* host = std::getenv("DOCWIRE_EMULATOR_HOST");
        if (host == nullptr || *host == '\0') return false;

        log_debug("RpcClientConfiguration.apply_environment", {},
                  "Using emulator at {}", host);
        base_url = std::string("http://") + host + "/v1";
        verify_tls = false;
        default_headers["Authorization"] = "Bearer owner";
        return true;
    }

    void BulkWriterOptions::validate() const {
        if (max_batch_size == 0) {
            throw std::invalid_argument(
                "Value for argument \"max_batch_size\" must be at least 1");
        }
        if (max_commit_attempts == 0 || max_commit_attempts > 10) {
            throw std::invalid_argument(
                "Value for argument \"max_commit_attempts\" must be within "
                "[1, 10] inclusive");
        }
        if (!throttling.enabled) return;

        const double initial = throttling.initial_ops_per_second;
        const double max = throttling.max_ops_per_second;
        if (std::isnan(initial) || initial < 1) {
            throw std::invalid_argument(
                "Value for argument \"initial_ops_per_second\" must be "
                "within [1, Infinity] inclusive");
        }
        if (std::isnan(max) || max < 1) {
            throw std::invalid_argument(
                "Value for argument \"max_ops_per_second\" must be within "
                "[1, Infinity] inclusive");
        }
        if (initial > max) {
            throw std::invalid_argument(
                "\"max_ops_per_second\" cannot be less than "
                "\"initial_ops_per_second\".");
        }
    }

}  // namespace docwire
