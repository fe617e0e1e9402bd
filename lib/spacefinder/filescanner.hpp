/**
 * @file filescanner.hpp
 * @brief Recursive directory scanning and file metadata collection
 *
 * This header defines the FileScanner class which walks one or more root
 * directories and builds a flat list of FileInfo records for every regular
 * file found, skipping system and hidden folders.
 */

#ifndef FILESCANNER_HPP
#define FILESCANNER_HPP

#include <atomic>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "fileinfo.hpp"

/**
 * @class FileScanner
 * @brief Walks directory trees and collects file metadata
 *
 * FileScanner performs a depth-first, top-down walk: the files of a directory
 * are recorded before any of its subdirectories is entered. Per-item failures
 * (permission denied, file vanished, unreadable directory) skip that item only;
 * a scan never throws for them.
 *
 * Key features:
 * - Fixed deny-list of system/vendor folder names plus hidden ('.') folders
 * - Multi-root scanning with continuous progress counts
 * - Cooperative cancellation through a polled stop flag
 * - Progress reporting via callbacks or atomic counters
 *
 * @see FileInfo
 */
class FileScanner {
private:
  /** @brief Optional atomic counter for thread-safe progress tracking */
  std::atomic<int> *m_progress_counter = nullptr;

public:
  /**
   * @brief Callback function type for progress notifications
   *
   * Function signature: void(const std::string &currentPath, int count)
   * - currentPath: Directory being scanned, or SCAN_COMPLETE at the end
   * - count: Number of files collected so far
   */
  using ProgressCallback =
      std::function<void(const std::string &currentPath, int count)>;

  /**
   * @brief Cancellation predicate, polled before every directory and file
   */
  using StopFlag = std::function<bool()>;

  /** @brief Number of files between two progress callbacks */
  static constexpr int PROGRESS_INTERVAL = 100;

  /** @brief Path reported with the final progress callback of a scan */
  static const std::string SCAN_COMPLETE;

  /**
   * @brief Folder names that are never descended into
   *
   * Matched case-sensitively against the last path component only.
   */
  static const std::unordered_set<std::string> SKIP_FOLDERS;

  /**
   * @brief Sets an atomic progress counter for thread-safe progress tracking
   *
   * The counter is incremented once per collected file. It is not reset by
   * this class; the caller manages initialization.
   *
   * @param counter Pointer to atomic integer counter, or nullptr to disable
   */
  void setProgressCounter(std::atomic<int> *counter) {
    m_progress_counter = counter;
  }

  /**
   * @brief Recursively scans one root directory
   *
   * @param root_path Directory to scan; a missing or unreadable root yields
   *                  an empty result
   * @param progress Optional progress callback (every PROGRESS_INTERVAL files
   *                 and once at the end with SCAN_COMPLETE)
   * @param should_stop Optional stop flag; when it returns true the files
   *                    collected so far are returned
   *
   * @return std::vector<FileInfo> Records in walk order
   */
  std::vector<FileInfo> scanDirectory(const std::filesystem::path &root_path,
                                      ProgressCallback progress = nullptr,
                                      StopFlag should_stop = nullptr);

  /**
   * @brief Scans several roots one after another
   *
   * Progress counts continue across roots. Once the stop flag is raised the
   * remaining roots are not scanned. The roots are passed through
   * normalizeRoots() first, so a file below two overlapping roots is
   * recorded once.
   *
   * @param root_paths Roots in scan order (empty list yields empty result)
   * @param progress Optional progress callback
   * @param should_stop Optional stop flag
   *
   * @return std::vector<FileInfo> Concatenated records of all scanned roots
   */
  std::vector<FileInfo>
  scanPaths(const std::vector<std::filesystem::path> &root_paths,
            ProgressCallback progress = nullptr,
            StopFlag should_stop = nullptr);

  /**
   * @brief Makes roots canonical and removes overlapping ones
   *
   * Each root is resolved with weakly_canonical() (symlinks resolved, missing
   * tails kept lexically normalized). A root equal to or nested below another
   * root in the list is dropped; the rest keep their first-seen order.
   *
   * Example: {"/home/u/Downloads", "/home/u", "/data", "/home/u/"} gives
   * {"/home/u", "/data"}.
   */
  static std::vector<std::filesystem::path>
  normalizeRoots(const std::vector<std::filesystem::path> &root_paths);

  /**
   * @brief Whether a directory with this name is skipped by the walk
   *
   * @param dir_name Last path component of the directory
   * @return true for deny-listed and hidden ('.'-prefixed) names
   */
  static bool isSkippedFolder(const std::string &dir_name);

  /**
   * @brief Reads the metadata of a single file
   *
   * @return std::nullopt if the file cannot be stat()ed or is not a
   *         regular file
   */
  static std::optional<FileInfo> readFileInfo(const std::filesystem::path &path);

private:
  /** @brief Mutable state threaded through one scanDirectory() call */
  struct WalkState {
    std::vector<FileInfo> results;
    int count = 0;
    bool stopped = false;
    const ProgressCallback *progress = nullptr;
    const StopFlag *should_stop = nullptr;
  };

  /**
   * @brief Processes the files of @p dir, then descends into its subfolders
   */
  void walkDirectory(const std::filesystem::path &dir, WalkState &state);

  static bool stopRequested(const WalkState &state) {
    return state.should_stop && *state.should_stop && (*state.should_stop)();
  }
};

#endif // FILESCANNER_HPP
