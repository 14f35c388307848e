#pragma once
#include <chrono>
#include <cstddef>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace docwire {
    /**
     * @brief Sizing of a ResourcePool.
     */
    struct ResourcePoolConfiguration {
        /** @brief Maximum number of operations that share one client. */
        std::size_t concurrent_operation_limit{100};

        /**
         * @brief Number of fully idle clients worth of spare capacity the
         * pool keeps before it starts destroying idle clients.
         */
        std::size_t max_idle_clients{1};
    };

    /**
     * @brief Parameters of an ExponentialBackoff.
     */
    struct BackoffSettings {
        /** @brief Delay used for the first non-immediate retry. */
        std::chrono::milliseconds initial_delay{1000};

        /** @brief Multiplier applied to the delay after each attempt. */
        double backoff_factor{1.5};

        /** @brief Upper bound of the base delay. */
        std::chrono::milliseconds max_delay{60000};

        /**
         * @brief Amount of random jitter, as a fraction of the base delay.
         * 1.0 means the actual delay is within +/-50% of the base.
         */
        double jitter_factor{1.0};
    };

    /**
     * @brief Configuration for the RpcClient and its HTTP channels.
     */
    struct RpcClientConfiguration {
        /** @brief Project the database belongs to. */
        std::string project_id;

        /** @brief Database inside the project. */
        std::string database_id{"(default)"};

        /** @brief Root of the REST endpoint, e.g. https://host/v1. */
        std::string base_url{"https://firestore.googleapis.com/v1"};

        /** @brief User-Agent string sent with each request. */
        std::string user_agent{"docwire/1.0"};

        /** @brief Headers added to every call. */
        std::map<std::string, std::string> default_headers;

        /** @brief Per-call timeout applied when a call sets none. */
        std::chrono::milliseconds request_timeout{60000};

        /** @brief Whether to verify TLS certificates. */
        bool verify_tls{true};

        /** @brief Interceptors applied to the options of every call. */
        std::vector<std::shared_ptr<const class CallInterceptor>> interceptors;

        /** @brief Sizing of the channel pool. */
        ResourcePoolConfiguration pool_config;

        /** @brief Backoff between stream open attempts. */
        BackoffSettings stream_backoff;

        /** @brief Maximum number of attempts to open a stream. */
        std::size_t max_stream_attempts{5};

        /// @brief "projects/<project>/databases/<database>"
        std::string database_path() const;

        /**
         * @brief Apply DOCWIRE_EMULATOR_HOST if it is set: plain HTTP to
         * host:port, no TLS verification and the emulator's "owner"
         * credentials.
         * @return true if the environment changed the configuration.
         */
        bool apply_environment();
    };

    /**
     * @brief Ramp-up throttling of a BulkWriter.
     */
    struct ThrottlingOptions {
        /** @brief Disable to send batches as fast as ordering permits. */
        bool enabled{true};

        /** @brief Operations per second allowed at start. */
        double initial_ops_per_second{500};

        /** @brief Ceiling of the ramp-up. */
        double max_ops_per_second{std::numeric_limits<double>::infinity()};
    };

    /**
     * @brief Options of a BulkWriter.
     */
    struct BulkWriterOptions {
        /** @brief Maximum number of writes committed in one request. */
        std::size_t max_batch_size{20};

        ThrottlingOptions throttling;

        /** @brief Backoff between commits of writes that failed with a
         * code batchWrite retries. */
        BackoffSettings commit_backoff;

        /** @brief Commit attempts per batch, within [1, 10]. */
        std::size_t max_commit_attempts{10};

        /// @brief Throws std::invalid_argument on an inconsistent setting.
        void validate() const;
    };
}  // namespace docwire
