/**
 * @file smartanalysis.hpp
 * @brief Heuristics for finding cleanable items in analyzed scan results
 *
 * The heuristics are thin filters over Analyzer output. Only
 * findEmptyFolders() touches the filesystem; everything else works on the
 * records passed in.
 *
 * @see Analyzer
 * @see ClassifiedFile
 */

#ifndef SMARTANALYSIS_HPP
#define SMARTANALYSIS_HPP

#include <ctime>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "classifiedfile.hpp"

/**
 * @struct FolderUsage
 * @brief Aggregated size of the files directly inside one folder
 */
struct FolderUsage {
  std::string path;
  long long totalSize = 0;
  int fileCount = 0;
};

/**
 * @struct DiskUsageReport
 * @brief Combined result of the file based heuristics
 *
 * potentialSavings covers the union of temp files and old downloads (a file
 * in both lists counts once). Large folders are listed for information and
 * are not a deletion target.
 */
struct DiskUsageReport {
  std::vector<ClassifiedFile> tempFiles;
  std::vector<ClassifiedFile> oldDownloads;
  std::vector<FolderUsage> largeFolders;
  long long tempSize = 0;
  long long downloadsSize = 0;
  long long potentialSavings = 0;
};

class SmartAnalysis {
public:
  using ProgressCallback =
      std::function<void(const std::string &currentPath, int checked)>;
  using StopFlag = std::function<bool()>;

  /** @brief Default threshold for findLargeFolders(): 1 GiB */
  static constexpr long long DEFAULT_LARGE_FOLDER_BYTES = 1024LL * 1024 * 1024;

  /** @brief Default age threshold for findOldDownloads() */
  static constexpr int DEFAULT_DOWNLOAD_DAYS = 30;

  /** @brief Folders between progress callbacks in findEmptyFolders() */
  static constexpr int PROGRESS_INTERVAL = 100;

  static const std::vector<std::string> TEMP_PATTERNS;
  static const std::vector<std::string> TEMP_EXTENSIONS;
  static const std::vector<std::string> USER_TEMP_PATHS;

  /**
   * @brief Whether a single file looks like a temporary or cache file
   *
   * Matches the extension against TEMP_EXTENSIONS, or the lower-cased path
   * against TEMP_PATTERNS and USER_TEMP_PATHS (substring match).
   */
  static bool isTempFile(const FileInfo &file);

  /**
   * @brief Files identified as temporary or cache files, in input order
   */
  static std::vector<ClassifiedFile>
  findTempFiles(const std::vector<ClassifiedFile> &files);

  /**
   * @brief Files under a "downloads" path not accessed for @p days_old days
   *
   * A file qualifies when its last access lies strictly before
   * now - days_old days.
   */
  static std::vector<ClassifiedFile>
  findOldDownloads(const std::vector<ClassifiedFile> &files,
                   int days_old = DEFAULT_DOWNLOAD_DAYS,
                   std::time_t now = std::time(nullptr));

  /**
   * @brief Folders whose direct files add up to at least @p min_size bytes
   *
   * Files are grouped by their immediate parent directory, without rolling
   * sizes up to ancestors.
   *
   * @return Folders sorted by size descending, ties by path
   */
  static std::vector<FolderUsage>
  findLargeFolders(const std::vector<ClassifiedFile> &files,
                   long long min_size = DEFAULT_LARGE_FOLDER_BYTES);

  /**
   * @brief Finds folders containing no files at any depth
   *
   * Walks each root bottom-up; a folder is empty when it has no entries
   * other than subfolders that are themselves empty. Recycle-bin and
   * "System Volume Information" folders are never reported and keep their
   * parents non-empty, as do unreadable folders.
   *
   * @param root_paths Roots to examine (the roots themselves may be reported)
   * @param progress Optional callback every PROGRESS_INTERVAL folders
   * @param should_stop Optional stop flag polled before every folder
   *
   * @return Empty folder paths, children before parents
   */
  static std::vector<std::string>
  findEmptyFolders(const std::vector<std::filesystem::path> &root_paths,
                   ProgressCallback progress = nullptr,
                   StopFlag should_stop = nullptr);

  /**
   * @brief Runs temp file, old download and large folder detection
   */
  static DiskUsageReport
  analyzeDiskUsage(const std::vector<ClassifiedFile> &files,
                   long long large_folder_min_size = DEFAULT_LARGE_FOLDER_BYTES,
                   int download_days = DEFAULT_DOWNLOAD_DAYS,
                   std::time_t now = std::time(nullptr));

private:
  struct EmptyFolderWalk {
    std::vector<std::string> empty_folders;
    int checked = 0;
    bool stopped = false;
    const ProgressCallback *progress = nullptr;
    const StopFlag *should_stop = nullptr;
  };

  /**
   * @brief Post-order helper; returns true if @p dir is empty
   */
  static bool collectEmptyFolders(const std::filesystem::path &dir,
                                  EmptyFolderWalk &walk);

  static bool isProtectedFolder(const std::string &path);
};

#endif // SMARTANALYSIS_HPP
