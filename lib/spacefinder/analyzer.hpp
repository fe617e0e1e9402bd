/**
 * @file analyzer.hpp
 * @brief File classification, staleness scoring, filtering and sorting
 */

#ifndef ANALYZER_HPP
#define ANALYZER_HPP

#include <ctime>
#include <string>
#include <vector>

#include "classifiedfile.hpp"
#include "fileinfo.hpp"

/**
 * @enum SortKey
 * @brief Sort criteria for Analyzer::sort()
 */
enum class SortKey { Size, LastAccessed, Staleness, Name, Category };

/**
 * @brief Maps "size", "accessed", "staleness", "name" or "category" to a
 *        SortKey; any other text falls back to SortKey::Size
 */
SortKey parseSortKey(const std::string &key);

/**
 * @brief Stateless analysis service over scanned files
 *
 * Every function takes its inputs by const reference and returns new
 * sequences; inputs are never modified. Functions depending on the current
 * time accept it as a trailing parameter defaulting to std::time(nullptr).
 *
 * Example usage:
 * @code
 * auto analyzed = Analyzer::analyze(scanner.scanPaths(roots));
 * auto videos = Analyzer::filter(analyzed, {Category::Video}, 100 * 1024 * 1024, 30);
 * auto ranked = Analyzer::sort(videos, SortKey::Staleness, true);
 * @endcode
 */
class Analyzer {
public:
  /** @brief Number of seconds in one day */
  static constexpr long long SECONDS_PER_DAY = 24 * 60 * 60;

  /**
   * @brief Determines the category of a file from extension and path
   *
   * ".exe" files count as Game when the lower-cased path contains a known
   * game installer/platform folder name, Other otherwise.
   *
   * @return Category Exactly one of the eight categories
   */
  static Category categorize(const FileInfo &file);

  /**
   * @brief Whole days elapsed between @p timestamp and @p now
   *
   * Truncated, never rounded. Timestamps in the future yield 0.
   */
  static long long daysSince(std::time_t timestamp,
                             std::time_t now = std::time(nullptr));

  /**
   * @brief Ranking heuristic: size in MiB times days since last access
   *
   * @return double 0 for files accessed today, otherwise grows with both
   *         size and age
   */
  static double stalenessScore(const FileInfo &file,
                               std::time_t now = std::time(nullptr));

  /**
   * @brief Classifies and scores every record, preserving input order
   */
  static std::vector<ClassifiedFile>
  analyze(const std::vector<FileInfo> &files,
          std::time_t now = std::time(nullptr));

  /**
   * @brief Keeps entries matching all criteria, preserving relative order
   *
   * @param files Analyzed files
   * @param categories Allowed categories; empty means no restriction
   * @param min_size Inclusive lower bound on size in bytes
   * @param min_days_old Inclusive lower bound on days since last access
   * @param exclusions Paths whose files (and subtrees) are removed; compared
   *                   case-insensitively
   * @param now Reference time for the age criterion
   */
  static std::vector<ClassifiedFile>
  filter(const std::vector<ClassifiedFile> &files,
         const std::vector<Category> &categories = {}, long long min_size = 0,
         int min_days_old = 0, const std::vector<std::string> &exclusions = {},
         std::time_t now = std::time(nullptr));

  /**
   * @brief Stable sort by the given key; ties keep their input order
   */
  static std::vector<ClassifiedFile>
  sort(const std::vector<ClassifiedFile> &files, SortKey key = SortKey::Size,
       bool descending = true);

  /**
   * @brief Whether @p path equals an excluded path or lies below one
   */
  static bool isExcluded(const std::string &path,
                         const std::vector<std::string> &exclusions);
};

#endif // ANALYZER_HPP
