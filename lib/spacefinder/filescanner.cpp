/**
 * @file filescanner.cpp
 * @brief Implementation of recursive directory scanning
 *
 * All filesystem calls inside the walk use the std::error_code overloads, so
 * an unreadable entry ends up skipped instead of aborting the scan.
 */

#include "filescanner.hpp"

#include <sys/stat.h>

namespace fs = std::filesystem;

const std::string FileScanner::SCAN_COMPLETE = "Scan complete";

const std::unordered_set<std::string> FileScanner::SKIP_FOLDERS = {
    "$Recycle.Bin",
    "System Volume Information",
    "Windows",
    "ProgramData",
    "Program Files",
    "Program Files (x86)",
    "Recovery",
    "PerfLogs",
    "$WinREAgent",
    "Config.Msi",
    "Documents and Settings",
    "MSOCache",
    "Intel",
    "AMD",
    "NVIDIA",
    "AppData",
};

bool FileScanner::isSkippedFolder(const std::string &dir_name) {
  if (!dir_name.empty() && dir_name[0] == '.')
    return true;
  return SKIP_FOLDERS.count(dir_name) > 0;
}

/**
 * @brief Reads size and timestamps of one file via stat()
 *
 * stat() follows symbolic links, so a link to a regular file is recorded
 * with the target's metadata. FIFOs, sockets and device nodes are rejected;
 * opening them later for hashing could block.
 *
 * @param path The file to inspect
 *
 * @return std::optional<FileInfo> The record, or std::nullopt on any error
 */
std::optional<FileInfo> FileScanner::readFileInfo(const fs::path &path) {
  struct stat st;
  if (::stat(path.c_str(), &st) != 0)
    return std::nullopt;

  if (!S_ISREG(st.st_mode))
    return std::nullopt;

  return FileInfo(path.string(), static_cast<long long>(st.st_size),
                  st.st_atime, st.st_mtime);
}

/**
 * @brief Recursively scans a directory and collects file information
 *
 * Progress callbacks are invoked:
 * - Every PROGRESS_INTERVAL files with the directory currently being scanned
 * - Once at the end with SCAN_COMPLETE and the final count, also after a stop
 *
 * @param root_path The directory to scan
 * @param progress Optional callback for progress updates
 * @param should_stop Optional stop flag polled before each directory and file
 *
 * @return std::vector<FileInfo> All regular files found before completion or
 *         stop
 */
std::vector<FileInfo> FileScanner::scanDirectory(const fs::path &root_path,
                                                 ProgressCallback progress,
                                                 StopFlag should_stop) {
  WalkState state;
  state.progress = &progress;
  state.should_stop = &should_stop;

  std::error_code ec;
  if (fs::is_directory(root_path, ec)) {
    walkDirectory(root_path, state);
  }

  // Final callback
  if (progress) {
    progress(SCAN_COMPLETE, state.count);
  }

  return std::move(state.results);
}

namespace {

// True if every component of root is a leading component of path
bool isWithin(const fs::path &path, const fs::path &root) {
  auto root_it = root.begin();
  auto path_it = path.begin();
  for (; root_it != root.end(); ++root_it, ++path_it) {
    if (path_it == path.end() || *path_it != *root_it)
      return false;
  }
  return true;
}

} // namespace

std::vector<fs::path>
FileScanner::normalizeRoots(const std::vector<fs::path> &root_paths) {
  std::vector<fs::path> normalized;
  normalized.reserve(root_paths.size());

  for (const auto &root : root_paths) {
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(root, ec);
    if (ec) {
      canonical = fs::absolute(root, ec).lexically_normal();
      if (ec)
        canonical = root.lexically_normal();
    }
    // "/a/b/" keeps an empty last component
    if (canonical.has_parent_path() && canonical.filename().empty())
      canonical = canonical.parent_path();
    normalized.push_back(canonical);
  }

  std::vector<fs::path> kept;
  for (std::size_t i = 0; i < normalized.size(); ++i) {
    bool covered = false;
    for (std::size_t j = 0; j < normalized.size() && !covered; ++j) {
      if (i == j || !isWithin(normalized[i], normalized[j]))
        continue;
      // Equal roots: the first one wins
      covered = normalized[i] != normalized[j] || j < i;
    }
    if (!covered)
      kept.push_back(normalized[i]);
  }
  return kept;
}

std::vector<FileInfo>
FileScanner::scanPaths(const std::vector<fs::path> &root_paths,
                       ProgressCallback progress, StopFlag should_stop) {
  std::vector<FileInfo> all_files;
  int total_count = 0;

  for (const auto &root : normalizeRoots(root_paths)) {
    if (should_stop && should_stop())
      break;

    ProgressCallback offset_progress = nullptr;
    if (progress) {
      offset_progress = [&progress, total_count](const std::string &path,
                                                 int count) {
        progress(path, total_count + count);
      };
    }

    std::vector<FileInfo> files =
        scanDirectory(root, offset_progress, should_stop);
    total_count += static_cast<int>(files.size());
    all_files.insert(all_files.end(), std::make_move_iterator(files.begin()),
                     std::make_move_iterator(files.end()));
  }

  return all_files;
}

/**
 * @brief Walks one directory level and recurses into permitted subfolders
 *
 * Subdirectories are gathered while the files are processed and entered
 * afterwards, giving a top-down order. Symbolic links to directories are not
 * followed.
 *
 * @param dir Directory to process
 * @param state Results, running count and stop status of the current scan
 */
void FileScanner::walkDirectory(const fs::path &dir, WalkState &state) {
  if (state.stopped || stopRequested(state)) {
    state.stopped = true;
    return;
  }

  std::error_code ec;
  fs::directory_iterator it(
      dir, fs::directory_options::skip_permission_denied, ec);
  if (ec)
    return; // Inaccessible directory: skip the whole subtree

  std::vector<fs::path> subdirs;

  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec)
      break;

    const fs::directory_entry &entry = *it;

    std::error_code type_ec;
    bool is_link = entry.is_symlink(type_ec);
    bool is_dir = entry.is_directory(type_ec);

    if (is_dir) {
      if (!is_link && !isSkippedFolder(entry.path().filename().string())) {
        subdirs.push_back(entry.path());
      }
      continue;
    }

    if (stopRequested(state)) {
      state.stopped = true;
      return;
    }

    std::optional<FileInfo> info = readFileInfo(entry.path());
    if (!info)
      continue; // Skip files we can't access

    state.results.push_back(std::move(*info));
    ++state.count;
    if (m_progress_counter) {
      ++(*m_progress_counter);
    }

    // Update progress every PROGRESS_INTERVAL files
    if (*state.progress && state.count % PROGRESS_INTERVAL == 0) {
      (*state.progress)(dir.string(), state.count);
    }
  }

  for (const auto &subdir : subdirs) {
    walkDirectory(subdir, state);
    if (state.stopped)
      return;
  }
}
