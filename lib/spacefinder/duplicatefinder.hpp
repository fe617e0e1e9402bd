#ifndef DUPLICATEFINDER_HPP
#define DUPLICATEFINDER_HPP

#include "classifiedfile.hpp"
#include "ihashcalculator.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

/**
 * @brief Service for duplicate file detection based on file content
 *
 * DuplicateFinder identifies byte-identical files with a three-stage funnel
 * that reads as little data as possible:
 * 1. Bucket by exact size (no I/O; empty files are never considered)
 * 2. Sub-bucket by a hash of the first PARTIAL_HASH_BYTES bytes
 * 3. Re-bucket by a hash of the full content; buckets of 2+ files are groups
 *
 * Stages 2 and 3 run per size bucket: a bucket is fully confirmed before the
 * next one is partially hashed.
 *
 * Every reported group is confirmed by the full-content hash, so partial hash
 * collisions never produce a group. Files that cannot be read at stage 2 or 3
 * are dropped from their bucket; the search continues.
 *
 * The stop flag is polled between buckets and between files of every stage.
 * A stopped search returns the groups of every bucket stage 3 had already
 * confirmed.
 *
 * @note Bucket iteration follows ascending size and hash order and keeps the
 *       input order inside each group, so results are reproducible.
 *
 * @see IHashCalculator
 * @see DuplicateStats
 *
 * Example usage:
 * @code
 * FNV1A partial;
 * Md5Hasher full;
 * DuplicateFinder finder(partial, full);
 * auto groups = finder.findDuplicates(analyzed);
 * auto stats = DuplicateFinder::duplicateStats(groups);
 * std::cout << "Wasted space: " << stats.wastedBytes << " bytes\n";
 * @endcode
 */
class DuplicateFinder {
public:
    /** @brief Duplicate groups keyed by their full-content hash */
    using DuplicateGroups = std::map<std::string, std::vector<ClassifiedFile>>;

    /**
     * @brief Progress notification: void(stage, current, total)
     *
     * current and total never decrease for one stage label; each label
     * counts from 0.
     */
    using ProgressCallback =
        std::function<void(const std::string& stage, int current, int total)>;

    using StopFlag = std::function<bool()>;

    struct DuplicateStats {
        int totalGroups = 0;
        int totalFiles = 0;
        long long wastedBytes = 0;  // Size of all copies but one per group
    };

    /** @brief Bytes hashed per file in the partial-hash stage */
    static constexpr std::uintmax_t PARTIAL_HASH_BYTES = 4096;

    /** @brief Files between progress callbacks while grouping by size */
    static constexpr int SIZE_PROGRESS_INTERVAL = 100;

    /** @brief Files between progress callbacks while hashing */
    static constexpr int HASH_PROGRESS_INTERVAL = 50;

    static const std::string STAGE_SIZE;
    static const std::string STAGE_PARTIAL_HASH;
    static const std::string STAGE_FULL_HASH;
    static const std::string STAGE_COMPLETE;

    /**
     * @brief Constructs a finder with the hashers for stages 2 and 3
     *
     * @param partialHasher Used on the first PARTIAL_HASH_BYTES of each file
     * @param fullHasher Used on the whole file; its digest keys the groups
     *
     * @note Both references must outlive the DuplicateFinder
     */
    DuplicateFinder(const IHashCalculator& partialHasher,
                    const IHashCalculator& fullHasher)
        : m_partialHasher(partialHasher), m_fullHasher(fullHasher) {}

    /**
     * @brief Finds groups of byte-identical files
     *
     * @param files Analyzed files; not modified
     * @param progress Optional progress callback
     * @param shouldStop Optional stop flag
     *
     * @return DuplicateGroups Confirmed groups of 2+ files, keyed by full hash
     */
    DuplicateGroups findDuplicates(const std::vector<ClassifiedFile>& files,
                                   ProgressCallback progress = nullptr,
                                   StopFlag shouldStop = nullptr) const;

    /**
     * @brief Totals over a set of duplicate groups
     *
     * wastedBytes sums memberSize * (memberCount - 1) per group: the space
     * freed by keeping exactly one copy of each.
     */
    static DuplicateStats duplicateStats(const DuplicateGroups& groups);

private:
    const IHashCalculator& m_partialHasher;
    const IHashCalculator& m_fullHasher;

    /** @brief Indices into the input vector */
    using Bucket = std::vector<std::size_t>;
};

#endif // DUPLICATEFINDER_HPP
