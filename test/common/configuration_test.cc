#include <gtest/gtest.h>
#include "../../src/common/configuration.h"
#include "../../src/common/cancellation.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>
#include <thread>

#include <unistd.h>

using namespace Prsync;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        ClearEnv();
        Configuration::getInstance().reset();
    }

    void TearDown() override {
        ClearEnv();
        Configuration::getInstance().reset();
    }

    static void ClearEnv() {
        for (const char* var : {"PRSYNC_JOBS", "PRSYNC_BUCKET_SIZE", "PRSYNC_RSYNC_ARGS",
                                "PRSYNC_SKIP_EXISTING", "PRSYNC_KILL_GRACE_MS"}) {
            unsetenv(var);
        }
    }

    Configuration& config() { return Configuration::getInstance(); }
};

TEST_F(ConfigurationTest, Defaults) {
    EXPECT_EQ(config().getJobs(), 4);
    EXPECT_EQ(config().getBucketSizeBytes(), 1000000000UL);
    EXPECT_EQ(config().getExtraFlags(), "-avz --progress");
    EXPECT_EQ(config().config().transfer.rsync_binary.get(), "rsync");
    EXPECT_EQ(config().config().session.ssh_binary.get(), "ssh");
    EXPECT_EQ(config().config().scheduler.kill_grace_ms.get(), 5000);
    EXPECT_FALSE(config().config().transfer.skip_existing.get());
    EXPECT_TRUE(config().validate());
}

TEST_F(ConfigurationTest, LoadsYaml) {
    ASSERT_TRUE(config().loadFromString(R"(
prsync:
  transfer:
    jobs: 8
    bucket_size_mb: 250
    extra_flags: "-a --delete"
    skip_existing: true
  session:
    ssh_binary: /usr/local/bin/ssh
  scheduler:
    kill_grace_ms: 1000
  report:
    path: /var/log/prsync.yaml
)"));

    EXPECT_EQ(config().getJobs(), 8);
    EXPECT_EQ(config().getBucketSizeBytes(), 250000000UL);
    EXPECT_EQ(config().getExtraFlags(), "-a --delete");
    EXPECT_TRUE(config().config().transfer.skip_existing.get());
    EXPECT_EQ(config().config().session.ssh_binary.get(), "/usr/local/bin/ssh");
    EXPECT_EQ(config().config().scheduler.kill_grace_ms.get(), 1000);
    EXPECT_EQ(config().config().report.path.get(), "/var/log/prsync.yaml");
}

TEST_F(ConfigurationTest, LoadsFile) {
    std::string path = (std::filesystem::temp_directory_path() /
                        ("prsync_config_" + std::to_string(::getpid()) + ".yaml")).string();
    std::ofstream(path) << "prsync:\n  transfer:\n    jobs: 2\n";

    EXPECT_TRUE(config().loadFromFile(path));
    EXPECT_EQ(config().getJobs(), 2);
    std::filesystem::remove(path);

    EXPECT_FALSE(config().loadFromFile(path)) << "A missing file must be reported";
}

// Test: YAML < environment < command line
TEST_F(ConfigurationTest, LayersResolveInPrecedenceOrder) {
    ASSERT_TRUE(config().loadFromString("prsync:\n  transfer:\n    jobs: 6\n"));
    EXPECT_EQ(config().getJobs(), 6);

    setenv("PRSYNC_JOBS", "12", 1);
    EXPECT_EQ(config().getJobs(), 12);

    config().config().transfer.jobs.setFromCommandLine(3);
    EXPECT_EQ(config().getJobs(), 3);
}

TEST_F(ConfigurationTest, EnvironmentValues) {
    setenv("PRSYNC_BUCKET_SIZE", "5000", 1);
    setenv("PRSYNC_RSYNC_ARGS", "-rt", 1);
    setenv("PRSYNC_SKIP_EXISTING", "yes", 1);

    EXPECT_EQ(config().getBucketSizeBytes(), 5000u);
    EXPECT_EQ(config().getExtraFlags(), "-rt");
    EXPECT_TRUE(config().config().transfer.skip_existing.get());
}

TEST_F(ConfigurationTest, UnparsableEnvironmentFallsBack) {
    setenv("PRSYNC_JOBS", "many", 1);
    setenv("PRSYNC_SKIP_EXISTING", "perhaps", 1);

    EXPECT_EQ(config().getJobs(), 4);
    EXPECT_FALSE(config().config().transfer.skip_existing.get());
}

TEST_F(ConfigurationTest, NegativeBucketSizeFromEnvironmentFallsBack) {
    setenv("PRSYNC_BUCKET_SIZE", "-1", 1);
    EXPECT_EQ(config().getBucketSizeBytes(), 1000000000u) << "-1 must not wrap to a huge size";

    setenv("PRSYNC_BUCKET_SIZE", "  -20", 1);
    EXPECT_EQ(config().getBucketSizeBytes(), 1000000000u);
}

TEST(MegabytesToBytesTest, ConvertsAndRejectsOverflow) {
    EXPECT_EQ(MegabytesToBytes(0), std::optional<size_t>(0));
    EXPECT_EQ(MegabytesToBytes(1000), std::optional<size_t>(1000000000UL));

    const size_t largest = std::numeric_limits<size_t>::max() / 1000000UL;
    EXPECT_EQ(MegabytesToBytes(largest), std::optional<size_t>(largest * 1000000UL));
    EXPECT_FALSE(MegabytesToBytes(largest + 1).has_value());
    EXPECT_FALSE(MegabytesToBytes(std::numeric_limits<size_t>::max()).has_value());
}

TEST_F(ConfigurationTest, OverflowingBucketSizeInYamlIsRejected) {
    EXPECT_TRUE(config().loadFromString("prsync:\n  transfer:\n    bucket_size_mb: 250\n"));
    EXPECT_EQ(config().getBucketSizeBytes(), 250000000u);

    config().reset();
    EXPECT_FALSE(config().loadFromString(
        "prsync:\n  transfer:\n    bucket_size_mb: 18446744073709551\n"));
    EXPECT_EQ(config().getBucketSizeBytes(), 1000000000u) << "Wrapped size must not be applied";
}

TEST_F(ConfigurationTest, ValidationCollectsAllErrors) {
    config().config().transfer.jobs.setFromCommandLine(0);
    config().config().transfer.bucket_size_bytes.setFromCommandLine(0);
    config().config().scheduler.kill_grace_ms.setFromCommandLine(-1);

    EXPECT_FALSE(config().validate());
    EXPECT_EQ(config().getValidationErrors().size(), 3u);
}

TEST_F(ConfigurationTest, InvalidYamlValuesFailValidation) {
    EXPECT_FALSE(config().loadFromString("prsync:\n  transfer:\n    jobs: 0\n"));
    EXPECT_FALSE(config().getValidationErrors().empty());
}

TEST_F(ConfigurationTest, MalformedYamlIsRejected) {
    EXPECT_FALSE(config().loadFromString("prsync: [unterminated"));
    EXPECT_FALSE(config().loadFromString("prsync:\n  transfer:\n    jobs: lots\n"));
}

TEST(CancellationTokenTest, CancelIsIdempotentAndWakesWaiters) {
    CancellationToken token;
    EXPECT_FALSE(token.IsCancelled());
    EXPECT_FALSE(token.WaitFor(absl::Milliseconds(1)));

    std::thread waiter([&token]() { EXPECT_TRUE(token.WaitFor(absl::Seconds(10))); });
    token.Cancel();
    token.Cancel();
    waiter.join();
    EXPECT_TRUE(token.IsCancelled());
}
