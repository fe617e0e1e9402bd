#include <algorithm>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "analyzer.hpp"
#include "duplicatefinder.hpp"
#include "fileexporter.hpp"
#include "filescanner.hpp"
#include "fnv1a.hpp"
#include "md5hasher.hpp"
#include "smartanalysis.hpp"
#include "utils.hpp"

namespace {

// Raised by Ctrl-C, polled by every long running stage
std::atomic<bool> g_stop_requested{false};

void handleInterrupt(int) { g_stop_requested = true; }

} // namespace

/**
 * @struct Options
 * @brief Command line settings for one run
 */
struct Options {
  std::vector<std::filesystem::path> roots;
  std::vector<Category> categories;
  long long minSize = 0;
  int minDays = 0;
  std::vector<std::string> exclusions;
  SortKey sortKey = SortKey::Size;
  bool descending = true;
  int limit = 20;
  bool duplicates = false;
  bool smart = false;
  long long largeFolderSize = SmartAnalysis::DEFAULT_LARGE_FOLDER_BYTES;
  int downloadDays = SmartAnalysis::DEFAULT_DOWNLOAD_DAYS;
  std::string exportPath;
};

/**
 * @class Application
 * @brief Runs scan -> analyze -> filter/sort -> report for the command line
 *
 * Results go to standard output, progress lines and warnings to standard
 * error. The stop flag handed to every stage is the SIGINT flag; a stopped
 * stage returns its partial result, which is reported like a complete one
 * with a note that the run was interrupted.
 */
class Application {
private:
  Options m_options;
  std::vector<ClassifiedFile> m_allFiles;

  static bool stopRequested() { return g_stop_requested.load(); }

public:
  explicit Application(Options options) : m_options(std::move(options)) {}

  int run() {
    FileScanner scanner;

    std::cerr << "Scanning " << m_options.roots.size() << " path(s)..."
              << std::endl;
    std::vector<FileInfo> files = scanner.scanPaths(
        m_options.roots,
        [](const std::string &path, int count) {
          std::cerr << "\rScanning... " << count << " files found. Current: "
                    << path.substr(0, 50) << "\x1b[K" << std::flush;
        },
        stopRequested);
    std::cerr << std::endl;

    m_allFiles = Analyzer::analyze(files);

    long long totalSize = 0;
    for (const auto &item : m_allFiles) {
      totalSize += item.file.getFileSize();
    }
    std::cout << "Scan " << (stopRequested() ? "interrupted" : "complete")
              << ". Found " << m_allFiles.size() << " files ("
              << formatBytes(totalSize) << " total)" << std::endl;

    std::vector<ClassifiedFile> selected = Analyzer::sort(
        Analyzer::filter(m_allFiles, m_options.categories, m_options.minSize,
                         m_options.minDays, m_options.exclusions),
        m_options.sortKey, m_options.descending);

    showFiles(selected);

    int status = 0;
    if (!m_options.exportPath.empty() && !exportFiles(selected)) {
      status = 1;
    }

    if (m_options.duplicates && !stopRequested()) {
      showDuplicates(selected);
    }

    if (m_options.smart && !stopRequested()) {
      showSmartAnalysis(selected);
    }

    return status;
  }

private:
  void showFiles(const std::vector<ClassifiedFile> &files) const {
    std::cout << "\n--- Files (" << files.size() << " matching) ---"
              << std::endl;

    std::size_t shown = files.size();
    if (m_options.limit > 0) {
      shown = std::min(shown, static_cast<std::size_t>(m_options.limit));
    }

    for (std::size_t i = 0; i < shown; ++i) {
      const ClassifiedFile &item = files[i];
      std::cout << "  " << formatBytes(item.file.getFileSize()) << "\t"
                << categoryName(item.category) << "\t"
                << formatDate(item.file.getLastAccessed()) << "\t"
                << "score " << static_cast<long long>(item.stalenessScore)
                << "\t" << item.file.getPath() << std::endl;
    }

    if (shown < files.size()) {
      std::cout << "  ... " << (files.size() - shown) << " more" << std::endl;
    }
  }

  bool exportFiles(const std::vector<ClassifiedFile> &files) const {
    std::string ext = toLower(
        std::filesystem::path(m_options.exportPath).extension().string());
    std::string format = ext == ".html" || ext == ".htm" ? "html" : "csv";

    if (!FileExporter::exportFiles(files, m_options.exportPath, format)) {
      std::cerr << "Error: could not write " << m_options.exportPath
                << std::endl;
      return false;
    }
    std::cout << "\nExported " << files.size() << " files to "
              << m_options.exportPath << std::endl;
    return true;
  }

  void showDuplicates(const std::vector<ClassifiedFile> &files) const {
    std::cout << "\n--- Duplicate detection (size, FNV-1a prefix, MD5) ---"
              << std::endl;

    FNV1A partialHasher;
    Md5Hasher fullHasher;
    DuplicateFinder finder(partialHasher, fullHasher);

    DuplicateFinder::DuplicateGroups groups = finder.findDuplicates(
        files,
        [](const std::string &stage, int current, int total) {
          std::cerr << "\r" << stage << ": " << current << "/" << total
                    << "\x1b[K" << std::flush;
        },
        stopRequested);
    std::cerr << std::endl;

    int groupNumber = 0;
    for (const auto &[hash, members] : groups) {
      ++groupNumber;
      std::cout << "\n# DUPLICATE GROUP " << groupNumber << " (MD5: " << hash
                << ", " << members.size() << " files, "
                << formatBytes(members.front().file.getFileSize()) << " each)"
                << std::endl;
      for (const auto &member : members) {
        std::cout << "    -> " << member.file.getPath() << std::endl;
      }
    }

    DuplicateFinder::DuplicateStats stats =
        DuplicateFinder::duplicateStats(groups);
    if (stats.totalGroups == 0) {
      std::cout << "\nNo duplicate groups found." << std::endl;
    } else {
      std::cout << "\nTotal " << stats.totalGroups << " duplicate groups, "
                << stats.totalFiles << " files, "
                << formatBytes(stats.wastedBytes) << " reclaimable."
                << std::endl;
    }
    if (stopRequested()) {
      std::cout << "(interrupted: only groups confirmed so far are listed)"
                << std::endl;
    }
  }

  void showSmartAnalysis(const std::vector<ClassifiedFile> &files) const {
    std::cout << "\n--- Smart analysis ---" << std::endl;

    DiskUsageReport report = SmartAnalysis::analyzeDiskUsage(
        files, m_options.largeFolderSize, m_options.downloadDays);

    std::cout << "Temporary/cache files: " << report.tempFiles.size() << " ("
              << formatBytes(report.tempSize) << ")" << std::endl;
    std::cout << "Downloads older than " << m_options.downloadDays
              << " days: " << report.oldDownloads.size() << " ("
              << formatBytes(report.downloadsSize) << ")" << std::endl;
    std::cout << "Potential savings: " << formatBytes(report.potentialSavings)
              << std::endl;

    std::cout << "\nFolders of at least "
              << formatBytes(m_options.largeFolderSize) << ": "
              << report.largeFolders.size() << std::endl;
    for (const auto &folder : report.largeFolders) {
      std::cout << "    " << formatBytes(folder.totalSize) << "\t"
                << folder.fileCount << " files\t" << folder.path << std::endl;
    }

    std::vector<std::string> emptyFolders = SmartAnalysis::findEmptyFolders(
        m_options.roots,
        [](const std::string &path, int checked) {
          std::cerr << "\rChecking folders... " << checked << " "
                    << path.substr(0, 50) << "\x1b[K" << std::flush;
        },
        stopRequested);
    std::cerr << "\r\x1b[K" << std::flush;

    std::cout << "\nEmpty folders: " << emptyFolders.size() << std::endl;
    for (const auto &folder : emptyFolders) {
      std::cout << "    " << folder << std::endl;
    }
  }
};

namespace {

void printUsage(const char *program) {
  std::cout
      << "Usage: " << program << " [options]\n"
      << "  -p, --path DIR         Directory to scan (repeatable, default: "
         "current directory)\n"
      << "  -c, --category NAME    Only show this category (repeatable): "
         "Video Audio Image Document Archive Code Game Other\n"
      << "  -s, --min-size SIZE    Minimum file size, e.g. \"100 MB\"\n"
      << "  -d, --min-days N       Minimum days since last access\n"
      << "  -x, --exclude PATH     Hide files below PATH (repeatable)\n"
      << "  -X, --exclude-file F   Read exclusions from F, one path per line\n"
      << "  -o, --sort KEY         size | accessed | staleness | name | "
         "category (default: size)\n"
      << "      --asc              Sort ascending (default: descending)\n"
      << "  -n, --limit N          Files to list, 0 for all (default: 20)\n"
      << "  -D, --duplicates       Find duplicate files among the matches\n"
      << "  -a, --smart            Temp files, old downloads, large and empty "
         "folders\n"
      << "      --large-folder SIZE  Large folder threshold (default: 1 GB)\n"
      << "      --download-days N  Old download threshold (default: 30)\n"
      << "  -e, --export FILE      Write matches to FILE (.csv or .html)\n"
      << "  -h, --help             Show this help\n";
}

bool readExclusionFile(const std::string &path,
                       std::vector<std::string> &exclusions) {
  std::ifstream in(path);
  if (!in)
    return false;

  std::string line;
  while (std::getline(in, line)) {
    line.erase(0, line.find_first_not_of(" \t"));
    line.erase(line.find_last_not_of(" \t\r") + 1);
    if (line.empty() || line[0] == '#')
      continue;
    exclusions.push_back(line);
  }
  return true;
}

} // namespace

int main(int argc, char *argv[]) {
  Options options;

  // Simple argument parser
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    }

    if (arg == "-D" || arg == "--duplicates") {
      options.duplicates = true;
      continue;
    }
    if (arg == "-a" || arg == "--smart") {
      options.smart = true;
      continue;
    }
    if (arg == "--asc") {
      options.descending = false;
      continue;
    }

    // Everything below takes a value
    if (i + 1 >= argc) {
      std::cerr << "Missing value or unknown option: " << arg << "\n";
      printUsage(argv[0]);
      return 2;
    }
    std::string value = argv[++i];

    if (arg == "-p" || arg == "--path") {
      options.roots.emplace_back(value);
    } else if (arg == "-c" || arg == "--category") {
      auto category = parseCategory(value);
      if (!category) {
        std::cerr << "Unknown category: " << value << "\n";
        return 2;
      }
      options.categories.push_back(*category);
    } else if (arg == "-s" || arg == "--min-size") {
      options.minSize = parseSize(value);
    } else if (arg == "-d" || arg == "--min-days") {
      options.minDays = parseDays(value);
    } else if (arg == "-x" || arg == "--exclude") {
      options.exclusions.push_back(value);
    } else if (arg == "-X" || arg == "--exclude-file") {
      if (!readExclusionFile(value, options.exclusions)) {
        std::cerr << "Cannot read exclusion file: " << value << "\n";
        return 2;
      }
    } else if (arg == "-o" || arg == "--sort") {
      options.sortKey = parseSortKey(value);
    } else if (arg == "-n" || arg == "--limit") {
      options.limit = parseDays(value);
    } else if (arg == "--large-folder") {
      options.largeFolderSize = parseSize(value);
    } else if (arg == "--download-days") {
      options.downloadDays = parseDays(value);
    } else if (arg == "-e" || arg == "--export") {
      options.exportPath = value;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      printUsage(argv[0]);
      return 2;
    }
  }

  std::signal(SIGINT, handleInterrupt);

  try {
    if (options.roots.empty()) {
      options.roots.push_back(std::filesystem::current_path());
    }
    // Overlapping roots would list one file twice
    options.roots = FileScanner::normalizeRoots(options.roots);

    Application app(std::move(options));
    return app.run();
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
