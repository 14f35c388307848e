#include <gtest/gtest.h>

#include <cstdlib>
#include <limits>
#include <stdexcept>

#include "docwire/config.hpp"

using namespace docwire;

TEST(ConfigTest, DatabasePath) {
    RpcClientConfiguration cfg;
    cfg.project_id = "my-project";
    EXPECT_EQ(cfg.database_path(), "projects/my-project/databases/(default)");
    cfg.database_id = "orders";
    EXPECT_EQ(cfg.database_path(), "projects/my-project/databases/orders");
}

TEST(ConfigTest, EmulatorHostOverridesEndpoint) {
    ::setenv("DOCWIRE_EMULATOR_HOST", "localhost:8080", 1);
    RpcClientConfiguration cfg;
    EXPECT_TRUE(cfg.apply_environment());
    ::unsetenv("DOCWIRE_EMULATOR_HOST");

    EXPECT_EQ(cfg.base_url, "http://localhost:8080/v1");
    EXPECT_FALSE(cfg.verify_tls);
    EXPECT_EQ(cfg.default_headers["Authorization"], "Bearer owner");
}

TEST(ConfigTest, NoEmulatorHostLeavesConfigUntouched) {
    ::unsetenv("DOCWIRE_EMULATOR_HOST");
    RpcClientConfiguration cfg;
    EXPECT_FALSE(cfg.apply_environment());
    EXPECT_EQ(cfg.base_url, "https://firestore.googleapis.com/v1");
    EXPECT_TRUE(cfg.verify_tls);
}

TEST(BulkWriterOptionsTest, Validation) {
    BulkWriterOptions ok;
    EXPECT_NO_THROW(ok.validate());

    BulkWriterOptions zero_batch;
    zero_batch.max_batch_size = 0;
    EXPECT_THROW(zero_batch.validate(), std::invalid_argument);

    BulkWriterOptions no_attempts;
    no_attempts.max_commit_attempts = 0;
    EXPECT_THROW(no_attempts.validate(), std::invalid_argument);
    no_attempts.max_commit_attempts = 11;
    EXPECT_THROW(no_attempts.validate(), std::invalid_argument);

    BulkWriterOptions low_initial;
    low_initial.throttling.initial_ops_per_second = 0.5;
    EXPECT_THROW(low_initial.validate(), std::invalid_argument);

    BulkWriterOptions nan_max;
    nan_max.throttling.max_ops_per_second =
        std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(nan_max.validate(), std::invalid_argument);

    BulkWriterOptions inverted;
    inverted.throttling.initial_ops_per_second = 100;
    inverted.throttling.max_ops_per_second = 50;
    EXPECT_THROW(inverted.validate(), std::invalid_argument);

    // Rates are not checked when throttling is off.
    inverted.throttling.enabled = false;
    EXPECT_NO_THROW(inverted.validate());
}
