/**
 * @file test_duplicatefinder.cpp
 * @brief Unit tests for the DuplicateFinder class
 *
 * The funnel is driven over real files in a temporary directory. A counting
 * wrapper around the hashers shows which stages touched which files, and a
 * constant partial hasher forces prefix collisions.
 *
 * @see DuplicateFinder
 * @see IHashCalculator
 */

#include <gtest/gtest.h>
#include "duplicatefinder.hpp"
#include "fnv1a.hpp"
#include "md5hasher.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {

/**
 * @brief Forwards to another hasher and counts the calls
 */
class CountingHasher : public IHashCalculator {
public:
    explicit CountingHasher(const IHashCalculator& inner) : m_inner(inner) {}

    std::string calculateHash(const std::string& filePath) const override {
        ++fullCalls;
        return m_inner.calculateHash(filePath);
    }

    std::string calculatePartialHash(const std::string& filePath,
                                     std::uintmax_t maxBytes) const override {
        ++partialCalls;
        return m_inner.calculatePartialHash(filePath, maxBytes);
    }

    mutable int fullCalls = 0;
    mutable int partialCalls = 0;

private:
    const IHashCalculator& m_inner;
};

/**
 * @brief Same partial hash for every readable file
 */
class CollidingHasher : public IHashCalculator {
public:
    std::string calculateHash(const std::string& filePath) const override {
        return fs::exists(filePath) ? "collision" : "";
    }

    std::string calculatePartialHash(const std::string& filePath,
                                     std::uintmax_t) const override {
        return calculateHash(filePath);
    }
};

} // namespace

/**
 * @class DuplicateFinderTest
 * @brief Fixture with a scratch directory and the production hashers
 */
class DuplicateFinderTest : public ::testing::Test {
protected:
    fs::path test_dir;
    FNV1A fnv;
    Md5Hasher md5;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "spacefinder_duplicate_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    ClassifiedFile createFile(const std::string& name, const std::string& content) {
        fs::path path = test_dir / name;
        std::ofstream(path, std::ios::binary) << content;
        FileInfo info(path.string(), static_cast<long long>(content.size()), 0, 0);
        return ClassifiedFile{info, Category::Other, 0.0};
    }

    static std::vector<std::string> names(const std::vector<ClassifiedFile>& group) {
        std::vector<std::string> result;
        for (const auto& item : group) {
            result.push_back(item.file.getName());
        }
        return result;
    }
};

TEST_F(DuplicateFinderTest, FindsNoDuplicatesInEmptyList) {
    DuplicateFinder finder(fnv, md5);
    EXPECT_TRUE(finder.findDuplicates({}).empty());
}

/**
 * @test GroupsIdenticalFiles
 * @brief Verifies identical files form one group keyed by their MD5 digest
 */
TEST_F(DuplicateFinderTest, GroupsIdenticalFiles) {
    std::vector<ClassifiedFile> files = {
        createFile("a.txt", "abc"),
        createFile("b.txt", "abc"),
        createFile("c.txt", "xyz"),
    };

    DuplicateFinder finder(fnv, md5);
    auto groups = finder.findDuplicates(files);

    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups.begin()->first, "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(names(groups.begin()->second), (std::vector<std::string>{"a.txt", "b.txt"}));
}

TEST_F(DuplicateFinderTest, KeepsInputOrderInsideGroups) {
    std::vector<ClassifiedFile> files = {
        createFile("c.bin", "same content"),
        createFile("a.bin", "same content"),
        createFile("b.bin", "same content"),
    };

    DuplicateFinder finder(fnv, md5);
    auto groups = finder.findDuplicates(files);

    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(names(groups.begin()->second),
              (std::vector<std::string>{"c.bin", "a.bin", "b.bin"}));
}

TEST_F(DuplicateFinderTest, FindsSeveralGroups) {
    std::vector<ClassifiedFile> files = {
        createFile("one_a", "first"),  createFile("two_a", "second!"),
        createFile("one_b", "first"),  createFile("two_b", "second!"),
        createFile("two_c", "second!"), createFile("lonely", "unique content"),
    };

    DuplicateFinder finder(fnv, md5);
    auto groups = finder.findDuplicates(files);

    ASSERT_EQ(groups.size(), 2u);
    auto stats = DuplicateFinder::duplicateStats(groups);
    EXPECT_EQ(stats.totalGroups, 2);
    EXPECT_EQ(stats.totalFiles, 5);
    EXPECT_EQ(stats.wastedBytes, 5 + 2 * 7);
}

/**
 * @test DistinctSizesNeedNoHashing
 * @brief Verifies files with unique sizes are never opened
 */
TEST_F(DuplicateFinderTest, DistinctSizesNeedNoHashing) {
    std::vector<ClassifiedFile> files = {
        createFile("a", "1"), createFile("b", "22"), createFile("c", "333"),
    };

    CountingHasher partial(fnv);
    CountingHasher full(md5);
    DuplicateFinder finder(partial, full);

    EXPECT_TRUE(finder.findDuplicates(files).empty());
    EXPECT_EQ(partial.partialCalls, 0);
    EXPECT_EQ(full.fullCalls, 0);
}

/**
 * @test DifferentPrefixSkipsFullHash
 * @brief Verifies same-size files with different first bytes stop at stage 2
 */
TEST_F(DuplicateFinderTest, DifferentPrefixSkipsFullHash) {
    std::vector<ClassifiedFile> files = {
        createFile("a", "AAAA"), createFile("b", "BBBB"),
    };

    CountingHasher partial(fnv);
    CountingHasher full(md5);
    DuplicateFinder finder(partial, full);

    EXPECT_TRUE(finder.findDuplicates(files).empty());
    EXPECT_EQ(partial.partialCalls, 2);
    EXPECT_EQ(full.fullCalls, 0);
}

TEST_F(DuplicateFinderTest, SamePrefixDifferentTailIsNotDuplicate) {
    std::string prefix(DuplicateFinder::PARTIAL_HASH_BYTES, 'p');
    std::vector<ClassifiedFile> files = {
        createFile("a", prefix + "tail-1"), createFile("b", prefix + "tail-2"),
    };

    CountingHasher full(md5);
    DuplicateFinder finder(fnv, full);

    EXPECT_TRUE(finder.findDuplicates(files).empty());
    EXPECT_EQ(full.fullCalls, 2);
}

/**
 * @test PartialCollisionDoesNotProduceGroup
 * @brief Verifies every group is confirmed by the full-content hash
 */
TEST_F(DuplicateFinderTest, PartialCollisionDoesNotProduceGroup) {
    std::vector<ClassifiedFile> files = {
        createFile("a", "12345"), createFile("b", "54321"), createFile("c", "12345"),
    };

    CollidingHasher colliding;
    DuplicateFinder finder(colliding, md5);
    auto groups = finder.findDuplicates(files);

    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(names(groups.begin()->second), (std::vector<std::string>{"a", "c"}));
}

TEST_F(DuplicateFinderTest, IgnoresEmptyFiles) {
    std::vector<ClassifiedFile> files = {
        createFile("empty1", ""), createFile("empty2", ""), createFile("empty3", ""),
    };

    CountingHasher partial(fnv);
    DuplicateFinder finder(partial, md5);

    EXPECT_TRUE(finder.findDuplicates(files).empty());
    EXPECT_EQ(partial.partialCalls, 0);
}

/**
 * @test DropsFilesThatVanished
 * @brief Verifies unreadable files leave their bucket without ending the search
 */
TEST_F(DuplicateFinderTest, DropsFilesThatVanished) {
    std::vector<ClassifiedFile> files = {
        createFile("keep1", "payload"), createFile("gone", "payload"),
        createFile("keep2", "payload"), createFile("solo_a", "other!!"),
        createFile("solo_b", "other!!"),
    };
    fs::remove(test_dir / "gone");
    fs::remove(test_dir / "solo_b");

    DuplicateFinder finder(fnv, md5);
    auto groups = finder.findDuplicates(files);

    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(names(groups.begin()->second), (std::vector<std::string>{"keep1", "keep2"}));
}

TEST_F(DuplicateFinderTest, StopBeforeWorkReturnsNothing) {
    std::vector<ClassifiedFile> files = {
        createFile("a", "abc"), createFile("b", "abc"),
    };

    CountingHasher partial(fnv);
    DuplicateFinder finder(partial, md5);
    auto groups = finder.findDuplicates(files, nullptr, [] { return true; });

    EXPECT_TRUE(groups.empty());
    EXPECT_EQ(partial.partialCalls, 0);
}

/**
 * @test StopKeepsConfirmedGroups
 * @brief Verifies a stop during stage 3 returns the groups confirmed so far
 *
 * The smaller size bucket is confirmed first; the stop flag turns on once
 * both of its files are hashed, so the larger bucket is never finished.
 */
TEST_F(DuplicateFinderTest, StopKeepsConfirmedGroups) {
    std::vector<ClassifiedFile> files = {
        createFile("big_a", "larger content"), createFile("small_a", "tiny"),
        createFile("big_b", "larger content"), createFile("small_b", "tiny"),
    };

    CountingHasher full(md5);
    DuplicateFinder finder(fnv, full);
    auto groups = finder.findDuplicates(files, nullptr, [&full] { return full.fullCalls >= 2; });

    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(names(groups.begin()->second), (std::vector<std::string>{"small_a", "small_b"}));
    EXPECT_EQ(full.fullCalls, 2);
}

/**
 * @test StopDuringPartialHashKeepsEarlierBuckets
 * @brief Verifies a bucket is confirmed before the next one is hashed
 *
 * The stop flag turns on once the first file of the larger size bucket has
 * its partial hash; the smaller bucket is already confirmed by then.
 */
TEST_F(DuplicateFinderTest, StopDuringPartialHashKeepsEarlierBuckets) {
    std::vector<ClassifiedFile> files = {
        createFile("big_a", "larger content"), createFile("small_a", "tiny"),
        createFile("big_b", "larger content"), createFile("small_b", "tiny"),
    };

    CountingHasher partial(fnv);
    CountingHasher full(md5);
    DuplicateFinder finder(partial, full);
    auto groups = finder.findDuplicates(files, nullptr,
                                        [&partial] { return partial.partialCalls >= 3; });

    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(names(groups.begin()->second), (std::vector<std::string>{"small_a", "small_b"}));
    EXPECT_EQ(partial.partialCalls, 3);
    EXPECT_EQ(full.fullCalls, 2);
}

/**
 * @test CountersNeverDecreasePerStage
 * @brief Verifies current and total only grow for each stage label
 *
 * Sixty pairs of distinct sizes give sixty buckets, so the partial and full
 * hash stages alternate many times.
 */
TEST_F(DuplicateFinderTest, CountersNeverDecreasePerStage) {
    std::vector<ClassifiedFile> files;
    for (int i = 1; i <= 60; ++i) {
        std::string content(static_cast<std::size_t>(i), 'x');
        files.push_back(createFile("a" + std::to_string(i), content));
        files.push_back(createFile("b" + std::to_string(i), content));
    }

    std::map<std::string, std::pair<int, int>> last;
    std::map<std::string, int> callsPerStage;
    DuplicateFinder finder(fnv, md5);
    auto groups = finder.findDuplicates(
        files, [&](const std::string& stage, int current, int total) {
            auto it = last.find(stage);
            if (it != last.end()) {
                EXPECT_GE(current, it->second.first) << stage;
                EXPECT_GE(total, it->second.second) << stage;
            }
            EXPECT_LE(current, total) << stage;
            last[stage] = {current, total};
            ++callsPerStage[stage];
        });

    EXPECT_EQ(groups.size(), 60u);
    // Start notification plus every 50 of 120 files
    EXPECT_EQ(callsPerStage[DuplicateFinder::STAGE_PARTIAL_HASH], 3);
    EXPECT_EQ(callsPerStage[DuplicateFinder::STAGE_FULL_HASH], 3);
    EXPECT_EQ(last[DuplicateFinder::STAGE_FULL_HASH], std::make_pair(100, 100));
    EXPECT_EQ(last[DuplicateFinder::STAGE_COMPLETE], std::make_pair(120, 120));
}

/**
 * @test ReportsStagesInOrder
 * @brief Verifies stage labels and the final "Complete" notification
 */
TEST_F(DuplicateFinderTest, ReportsStagesInOrder) {
    std::vector<ClassifiedFile> files = {
        createFile("a", "dup"), createFile("b", "dup"), createFile("c", "dup"),
        createFile("d", "unique"),
    };

    std::vector<std::tuple<std::string, int, int>> calls;
    DuplicateFinder finder(fnv, md5);
    finder.findDuplicates(files, [&calls](const std::string& stage, int current, int total) {
        calls.emplace_back(stage, current, total);
    });

    ASSERT_GE(calls.size(), 4u);
    EXPECT_EQ(calls.front(), std::make_tuple(DuplicateFinder::STAGE_SIZE, 0, 4));
    EXPECT_EQ(calls.back(), std::make_tuple(DuplicateFinder::STAGE_COMPLETE, 3, 3));

    std::vector<std::string> stages;
    for (const auto& call : calls) {
        if (stages.empty() || stages.back() != std::get<0>(call)) {
            stages.push_back(std::get<0>(call));
        }
    }
    EXPECT_EQ(stages, (std::vector<std::string>{
                          DuplicateFinder::STAGE_SIZE, DuplicateFinder::STAGE_PARTIAL_HASH,
                          DuplicateFinder::STAGE_FULL_HASH, DuplicateFinder::STAGE_COMPLETE}));
}

TEST_F(DuplicateFinderTest, ReportsCompleteWithoutCandidates) {
    std::vector<ClassifiedFile> files = {createFile("a", "x"), createFile("b", "yy")};

    std::vector<std::string> stages;
    DuplicateFinder finder(fnv, md5);
    finder.findDuplicates(files, [&stages](const std::string& stage, int, int) {
        stages.push_back(stage);
    });

    ASSERT_FALSE(stages.empty());
    EXPECT_EQ(stages.back(), DuplicateFinder::STAGE_COMPLETE);
}

/**
 * @test CalculatesWastedSpace
 * @brief Verifies wasted space keeps exactly one copy per group
 */
TEST(DuplicateStatsTest, CalculatesWastedSpace) {
    FileInfo info("/data/copy.bin", 1000, 0, 0);
    ClassifiedFile item{info, Category::Other, 0.0};

    DuplicateFinder::DuplicateGroups groups;
    groups["hash"] = {item, item, item};

    auto stats = DuplicateFinder::duplicateStats(groups);
    EXPECT_EQ(stats.totalGroups, 1);
    EXPECT_EQ(stats.totalFiles, 3);
    EXPECT_EQ(stats.wastedBytes, 2000);
}

TEST(DuplicateStatsTest, EmptyGroups) {
    auto stats = DuplicateFinder::duplicateStats({});
    EXPECT_EQ(stats.totalGroups, 0);
    EXPECT_EQ(stats.totalFiles, 0);
    EXPECT_EQ(stats.wastedBytes, 0);
}
