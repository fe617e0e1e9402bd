/**
 * @file duplicatefinder.cpp
 * @brief Implementation of the size / partial hash / full hash funnel
 */

#include "duplicatefinder.hpp"

const std::string DuplicateFinder::STAGE_SIZE = "Grouping by size";
const std::string DuplicateFinder::STAGE_PARTIAL_HASH = "Calculating partial hashes";
const std::string DuplicateFinder::STAGE_FULL_HASH = "Calculating full hashes";
const std::string DuplicateFinder::STAGE_COMPLETE = "Complete";

DuplicateFinder::DuplicateGroups
DuplicateFinder::findDuplicates(const std::vector<ClassifiedFile>& files,
                                ProgressCallback progress,
                                StopFlag shouldStop) const {
    DuplicateGroups duplicates;

    auto stopped = [&shouldStop]() { return shouldStop && shouldStop(); };
    auto report = [&progress](const std::string& stage, int current, int total) {
        if (progress) {
            progress(stage, current, total);
        }
    };

    // Stage 1: Group by size (files must be same size to be duplicates)
    const int fileCount = static_cast<int>(files.size());
    std::map<long long, Bucket> sizeGroups;

    for (std::size_t i = 0; i < files.size(); ++i) {
        if (stopped())
            return duplicates;

        if (!files[i].file.zeroFiles()) {
            sizeGroups[files[i].file.getFileSize()].push_back(i);
        }

        if (static_cast<int>(i) % SIZE_PROGRESS_INTERVAL == 0) {
            report(STAGE_SIZE, static_cast<int>(i), fileCount);
        }
    }

    std::vector<const Bucket*> candidates;
    int candidateTotal = 0;
    for (const auto& [size, bucket] : sizeGroups) {
        if (bucket.size() >= 2) {
            candidates.push_back(&bucket);
            candidateTotal += static_cast<int>(bucket.size());
        }
    }

    if (!candidates.empty()) {
        report(STAGE_PARTIAL_HASH, 0, candidateTotal);
    }

    // Running counters, never reset between size buckets
    int checked = 0;
    int hashed = 0;
    int fullTotal = 0;

    for (const Bucket* sizeBucket : candidates) {
        if (stopped())
            return duplicates;

        // Stage 2: Partial hashes within this size bucket
        std::map<std::string, Bucket> partialGroups;

        for (std::size_t index : *sizeBucket) {
            if (stopped())
                return duplicates;

            std::string partialHash = m_partialHasher.calculatePartialHash(
                files[index].file.getPath(), PARTIAL_HASH_BYTES);

            // Unreadable file: drop it
            if (!partialHash.empty()) {
                partialGroups[partialHash].push_back(index);
            }

            ++checked;
            if (checked % HASH_PROGRESS_INTERVAL == 0) {
                report(STAGE_PARTIAL_HASH, checked, candidateTotal);
            }
        }

        // Stage 3: Full hash confirms each partial match before the next
        // size bucket starts
        for (const auto& [partialHash, bucket] : partialGroups) {
            if (bucket.size() < 2)
                continue;

            if (stopped())
                return duplicates;

            if (fullTotal == 0) {
                report(STAGE_FULL_HASH, 0, static_cast<int>(bucket.size()));
            }
            fullTotal += static_cast<int>(bucket.size());

            std::map<std::string, Bucket> fullGroups;

            for (std::size_t index : bucket) {
                if (stopped())
                    return duplicates;

                std::string fullHash =
                    m_fullHasher.calculateHash(files[index].file.getPath());

                if (!fullHash.empty()) {
                    fullGroups[fullHash].push_back(index);
                }

                ++hashed;
                if (hashed % HASH_PROGRESS_INTERVAL == 0) {
                    report(STAGE_FULL_HASH, hashed, fullTotal);
                }
            }

            // Single survivors were partial-hash collisions
            for (const auto& [fullHash, members] : fullGroups) {
                if (members.size() < 2)
                    continue;

                std::vector<ClassifiedFile>& group = duplicates[fullHash];
                for (std::size_t index : members) {
                    group.push_back(files[index]);
                }
            }
        }
    }

    report(STAGE_COMPLETE, candidateTotal, candidateTotal);

    return duplicates;
}

DuplicateFinder::DuplicateStats
DuplicateFinder::duplicateStats(const DuplicateGroups& groups) {
    DuplicateStats stats;
    stats.totalGroups = static_cast<int>(groups.size());

    for (const auto& [hash, members] : groups) {
        stats.totalFiles += static_cast<int>(members.size());

        // Keep 1, rest is waste
        if (members.size() >= 2) {
            stats.wastedBytes += members.front().file.getFileSize() *
                                 static_cast<long long>(members.size() - 1);
        }
    }

    return stats;
}
