#include <gtest/gtest.h>
#include "../../src/bucketer/bucketer.h"
#include "../../src/common/errors.h"

#include <cstdint>
#include <limits>
#include <random>
#include <set>
#include <string>
#include <vector>

using namespace Prsync;

namespace {
constexpr uint64_t MB = 1000ULL * 1000ULL;
}

class BucketerTest : public ::testing::Test {
protected:
    static std::vector<FileEntry> Files(const std::vector<uint64_t>& sizes) {
        std::vector<FileEntry> files;
        for (size_t i = 0; i < sizes.size(); ++i) {
            files.push_back({"file_" + std::to_string(i), sizes[i]});
        }
        return files;
    }

    static void ExpectWellFormed(const std::vector<Bucket>& buckets, uint64_t target) {
        for (size_t i = 0; i < buckets.size(); ++i) {
            const Bucket& b = buckets[i];
            EXPECT_EQ(b.id, static_cast<int>(i)) << "Bucket ids must be 0..N-1 in order";
            ASSERT_FALSE(b.files.empty()) << "No bucket may be empty";
            uint64_t sum = 0;
            for (const auto& f : b.files) sum += f.size;
            EXPECT_EQ(b.total_size, sum) << "total_size must equal the sum of file sizes";
            if (b.files.size() > 1) {
                EXPECT_LE(b.total_size, target) << "Multi-file bucket " << b.id << " exceeds the cap";
            }
        }
    }
};

// Test 1: The 10 x 300MB example packs three files per bucket
TEST_F(BucketerTest, TenFilesOfThreeHundredMegabytes) {
    auto buckets = Partition(Files(std::vector<uint64_t>(10, 300 * MB)), 1000 * MB);

    ASSERT_EQ(buckets.size(), 4u);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(buckets[i].files.size(), 3u);
        EXPECT_EQ(buckets[i].total_size, 900 * MB);
    }
    EXPECT_EQ(buckets[3].files.size(), 1u);
    EXPECT_EQ(buckets[3].total_size, 300 * MB);
    EXPECT_EQ(buckets[3].files[0].path, "file_9");
}

// Test 2: A file larger than the cap gets a bucket of its own
TEST_F(BucketerTest, OversizedFileIsAlone) {
    auto buckets = Partition(Files({5000 * MB}), 1000 * MB);

    ASSERT_EQ(buckets.size(), 1u);
    EXPECT_EQ(buckets[0].files.size(), 1u);
    EXPECT_EQ(buckets[0].total_size, 5000 * MB);
}

TEST_F(BucketerTest, OversizedFileBetweenSmallOnes) {
    auto buckets = Partition(Files({100 * MB, 5000 * MB, 100 * MB}), 1000 * MB);

    ASSERT_EQ(buckets.size(), 3u);
    EXPECT_EQ(buckets[0].files[0].path, "file_0");
    EXPECT_EQ(buckets[1].files.size(), 1u);
    EXPECT_EQ(buckets[1].total_size, 5000 * MB);
    EXPECT_EQ(buckets[2].files[0].path, "file_2");
    ExpectWellFormed(buckets, 1000 * MB);
}

// Test 3: Edge cases
TEST_F(BucketerTest, EmptyInventoryYieldsNoBuckets) {
    EXPECT_TRUE(Partition({}, 1000 * MB).empty());
}

TEST_F(BucketerTest, ZeroTargetIsConfigError) {
    EXPECT_THROW(Partition(Files({1}), 0), ConfigError);
}

TEST_F(BucketerTest, ExactFitStaysInBucket) {
    auto buckets = Partition(Files({400, 600, 1}), 1000);

    ASSERT_EQ(buckets.size(), 2u);
    EXPECT_EQ(buckets[0].total_size, 1000u);
    EXPECT_EQ(buckets[1].total_size, 1u);
}

TEST_F(BucketerTest, ZeroByteFilesAreKept) {
    auto buckets = Partition(Files({0, 0, 0}), 1);

    ASSERT_EQ(buckets.size(), 1u);
    EXPECT_EQ(buckets[0].files.size(), 3u);
    EXPECT_EQ(buckets[0].total_size, 0u);
}

TEST_F(BucketerTest, HugeSizesDoNotOverflow) {
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    auto buckets = Partition(Files({max - 10, max - 10}), max - 5);

    ASSERT_EQ(buckets.size(), 2u) << "Second file must not wrap around into the first bucket";
    ExpectWellFormed(buckets, max - 5);
}

TEST_F(BucketerTest, DuplicatePathsAreNotDeduplicated) {
    std::vector<FileEntry> files = {{"same", 10}, {"same", 10}};
    auto buckets = Partition(files, 1000);

    ASSERT_EQ(buckets.size(), 1u);
    EXPECT_EQ(buckets[0].files.size(), 2u);
}

// Test 4: Every file lands in exactly one bucket, in input order
TEST_F(BucketerTest, RandomInventoriesArePartitionedCompletely) {
    std::mt19937_64 rng(42);
    std::uniform_int_distribution<uint64_t> size_dist(0, 3000);

    for (int round = 0; round < 50; ++round) {
        std::vector<uint64_t> sizes(1 + rng() % 200);
        for (auto& s : sizes) s = size_dist(rng);
        const uint64_t target = 1 + rng() % 2000;

        auto input = Files(sizes);
        auto buckets = Partition(input, target);
        ExpectWellFormed(buckets, target);

        std::vector<std::string> seen;
        for (const auto& b : buckets) {
            for (const auto& f : b.files) seen.push_back(f.path);
        }
        ASSERT_EQ(seen.size(), input.size());
        for (size_t i = 0; i < input.size(); ++i) {
            EXPECT_EQ(seen[i], input[i].path);
        }
        EXPECT_EQ(std::set<std::string>(seen.begin(), seen.end()).size(), input.size());

        uint64_t expected_total = 0;
        for (auto s : sizes) expected_total += s;
        EXPECT_EQ(TotalBytes(buckets), expected_total);
    }
}
