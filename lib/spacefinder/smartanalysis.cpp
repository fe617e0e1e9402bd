/**
 * @file smartanalysis.cpp
 * @brief Implementation of the cleanup heuristics
 */

#include "smartanalysis.hpp"

#include <algorithm>
#include <map>
#include <unordered_set>

#include "analyzer.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

// Common temporary/cache folder and file names
const std::vector<std::string> SmartAnalysis::TEMP_PATTERNS = {
    "temp",         "tmp",  "cache", "caches",    ".cache",      "temporary",
    "__pycache__",  "node_modules",  ".npm",      ".yarn",       ".nuget",
    "obj",          "bin",  "thumbs.db", "desktop.ini", ".ds_store",
};

const std::vector<std::string> SmartAnalysis::TEMP_EXTENSIONS = {
    ".tmp", ".temp", ".bak", ".old", ".orig",
    ".log", ".dmp",  ".crash", ".swp", ".swo",
};

// Per-user cache locations (Windows profiles and freedesktop)
const std::vector<std::string> SmartAnalysis::USER_TEMP_PATHS = {
    "AppData\\Local\\Temp",
    "AppData\\Local\\Microsoft\\Windows\\Temporary Internet Files",
    "AppData\\Local\\Microsoft\\Windows\\INetCache",
    "AppData\\Local\\Microsoft\\Windows\\WebCache",
    "AppData\\Local\\Google\\Chrome\\User Data\\Default\\Cache",
    "AppData\\Local\\Mozilla\\Firefox\\Profiles",
    "/.local/share/Trash/",
    "/.thumbnails/",
};

bool SmartAnalysis::isTempFile(const FileInfo &file) {
  const std::string ext = toLower(file.getExtension());
  if (std::find(TEMP_EXTENSIONS.begin(), TEMP_EXTENSIONS.end(), ext) !=
      TEMP_EXTENSIONS.end()) {
    return true;
  }

  const std::string path_lower = toLower(file.getPath());
  for (const auto &pattern : TEMP_PATTERNS) {
    if (path_lower.find(pattern) != std::string::npos)
      return true;
  }

  for (const auto &temp_path : USER_TEMP_PATHS) {
    if (path_lower.find(toLower(temp_path)) != std::string::npos)
      return true;
  }

  return false;
}

std::vector<ClassifiedFile>
SmartAnalysis::findTempFiles(const std::vector<ClassifiedFile> &files) {
  std::vector<ClassifiedFile> temp_files;
  for (const auto &item : files) {
    if (isTempFile(item.file))
      temp_files.push_back(item);
  }
  return temp_files;
}

std::vector<ClassifiedFile>
SmartAnalysis::findOldDownloads(const std::vector<ClassifiedFile> &files,
                                int days_old, std::time_t now) {
  const long long cutoff =
      static_cast<long long>(now) - days_old * Analyzer::SECONDS_PER_DAY;

  std::vector<ClassifiedFile> old_downloads;
  for (const auto &item : files) {
    if (toLower(item.file.getPath()).find("downloads") == std::string::npos)
      continue;

    if (static_cast<long long>(item.file.getLastAccessed()) < cutoff)
      old_downloads.push_back(item);
  }
  return old_downloads;
}

std::vector<FolderUsage>
SmartAnalysis::findLargeFolders(const std::vector<ClassifiedFile> &files,
                                long long min_size) {
  std::map<std::string, FolderUsage> folder_stats;

  for (const auto &item : files) {
    const std::string folder = item.file.getParentPath();
    FolderUsage &usage = folder_stats[folder];
    usage.path = folder;
    usage.totalSize += item.file.getFileSize();
    usage.fileCount += 1;
  }

  std::vector<FolderUsage> large_folders;
  for (const auto &[folder, usage] : folder_stats) {
    if (usage.totalSize >= min_size)
      large_folders.push_back(usage);
  }

  // Map order gives path ascending for equal sizes
  std::stable_sort(large_folders.begin(), large_folders.end(),
                   [](const FolderUsage &a, const FolderUsage &b) {
                     return a.totalSize > b.totalSize;
                   });

  return large_folders;
}

bool SmartAnalysis::isProtectedFolder(const std::string &path) {
  const std::string path_lower = toLower(path);
  return path_lower.find("$recycle") != std::string::npos ||
         path_lower.find("system volume") != std::string::npos;
}

std::vector<std::string>
SmartAnalysis::findEmptyFolders(const std::vector<fs::path> &root_paths,
                                ProgressCallback progress,
                                StopFlag should_stop) {
  EmptyFolderWalk walk;
  walk.progress = &progress;
  walk.should_stop = &should_stop;

  for (const auto &root : root_paths) {
    if (should_stop && should_stop())
      break;

    std::error_code ec;
    if (!fs::is_directory(root, ec))
      continue;

    collectEmptyFolders(root, walk);
    if (walk.stopped)
      break;
  }

  return walk.empty_folders;
}

/**
 * @brief Decides emptiness of @p dir after deciding all of its children
 *
 * Children are fully examined before the parent is recorded, so each folder
 * is visited once and its result is known when the parent needs it.
 *
 * @param dir Folder to examine
 * @param walk Accumulated results, progress and stop status
 *
 * @return true if @p dir contains only empty folders (or nothing)
 */
bool SmartAnalysis::collectEmptyFolders(const fs::path &dir,
                                        EmptyFolderWalk &walk) {
  if (*walk.should_stop && (*walk.should_stop)()) {
    walk.stopped = true;
    return false;
  }

  ++walk.checked;
  if (*walk.progress && walk.checked % PROGRESS_INTERVAL == 0) {
    (*walk.progress)(dir.string(), walk.checked);
  }

  // Skip system folders
  if (isProtectedFolder(dir.string()))
    return false;

  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec)
    return false; // Unreadable: emptiness unknown

  bool empty = true;
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec)
      return false;

    const fs::directory_entry &entry = *it;
    std::error_code type_ec;
    bool is_link = entry.is_symlink(type_ec);
    bool is_dir = entry.is_directory(type_ec);

    if (is_dir && !is_link) {
      if (!collectEmptyFolders(entry.path(), walk))
        empty = false;
      if (walk.stopped)
        return false;
    } else {
      empty = false;
    }
  }

  if (empty)
    walk.empty_folders.push_back(dir.string());
  return empty;
}

DiskUsageReport
SmartAnalysis::analyzeDiskUsage(const std::vector<ClassifiedFile> &files,
                                long long large_folder_min_size,
                                int download_days, std::time_t now) {
  DiskUsageReport report;
  report.tempFiles = findTempFiles(files);
  report.largeFolders = findLargeFolders(files, large_folder_min_size);
  report.oldDownloads = findOldDownloads(files, download_days, now);

  std::unordered_set<std::string> temp_paths;
  for (const auto &item : report.tempFiles) {
    report.tempSize += item.file.getFileSize();
    temp_paths.insert(item.file.getPath());
  }

  // A temp file inside Downloads counts once towards the savings
  long long downloads_only = 0;
  for (const auto &item : report.oldDownloads) {
    report.downloadsSize += item.file.getFileSize();
    if (temp_paths.count(item.file.getPath()) == 0)
      downloads_only += item.file.getFileSize();
  }

  report.potentialSavings = report.tempSize + downloads_only;
  return report;
}
