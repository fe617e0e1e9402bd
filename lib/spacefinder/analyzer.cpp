/**
 * @file analyzer.cpp
 * @brief Implementation of file categorization and analysis
 */

#include "analyzer.hpp"

#include <algorithm>
#include <map>
#include <unordered_set>

namespace {

// Extension tables, matched on the lower-cased extension
const std::map<Category, std::unordered_set<std::string>> CATEGORY_EXTENSIONS = {
    {Category::Video,
     {".mp4", ".mkv", ".avi", ".mov", ".wmv", ".flv", ".webm", ".m4v", ".mpeg",
      ".mpg", ".3gp"}},
    {Category::Audio,
     {".mp3", ".wav", ".flac", ".aac", ".ogg", ".wma", ".m4a", ".opus"}},
    {Category::Image,
     {".jpg", ".jpeg", ".png", ".gif", ".bmp", ".webp", ".svg", ".ico", ".tiff",
      ".raw", ".psd"}},
    {Category::Document,
     {".pdf", ".doc", ".docx", ".xls", ".xlsx", ".ppt", ".pptx", ".txt", ".rtf",
      ".odt", ".ods"}},
    {Category::Archive,
     {".zip", ".rar", ".7z", ".tar", ".gz", ".bz2", ".xz", ".iso"}},
    {Category::Code,
     {".py", ".js", ".ts", ".java", ".cpp", ".c", ".h", ".cs", ".go", ".rs",
      ".rb", ".php"}},
};

const std::string EXECUTABLE_EXTENSION = ".exe";

// Known game installation folders
const std::vector<std::string> GAME_PATHS = {
    "steam", "steamapps",  "epic games", "origin",     "ubisoft",
    "games", "riot games", "battle.net", "gog galaxy", "xbox",
};

} // namespace

SortKey parseSortKey(const std::string &key) {
  if (key == "accessed")
    return SortKey::LastAccessed;
  if (key == "staleness")
    return SortKey::Staleness;
  if (key == "name")
    return SortKey::Name;
  if (key == "category")
    return SortKey::Category;
  return SortKey::Size;
}

Category Analyzer::categorize(const FileInfo &file) {
  const std::string ext = toLower(file.getExtension());

  if (ext == EXECUTABLE_EXTENSION) {
    const std::string path_lower = toLower(file.getPath());
    for (const auto &game_path : GAME_PATHS) {
      if (path_lower.find(game_path) != std::string::npos)
        return Category::Game;
    }
    return Category::Other;
  }

  for (const auto &[category, extensions] : CATEGORY_EXTENSIONS) {
    if (extensions.count(ext) > 0)
      return category;
  }

  return Category::Other;
}

long long Analyzer::daysSince(std::time_t timestamp, std::time_t now) {
  long long elapsed = static_cast<long long>(now) - static_cast<long long>(timestamp);
  if (elapsed <= 0)
    return 0;
  return elapsed / SECONDS_PER_DAY;
}

double Analyzer::stalenessScore(const FileInfo &file, std::time_t now) {
  double size_mb = static_cast<double>(file.getFileSize()) / (1024.0 * 1024.0);
  return size_mb * static_cast<double>(daysSince(file.getLastAccessed(), now));
}

std::vector<ClassifiedFile> Analyzer::analyze(const std::vector<FileInfo> &files,
                                              std::time_t now) {
  std::vector<ClassifiedFile> analyzed;
  analyzed.reserve(files.size());

  for (const auto &info : files) {
    analyzed.push_back(ClassifiedFile{info, categorize(info),
                                      stalenessScore(info, now)});
  }
  return analyzed;
}

bool Analyzer::isExcluded(const std::string &path,
                          const std::vector<std::string> &exclusions) {
  const std::string path_lower = toLower(path);

  for (const auto &exclusion : exclusions) {
    std::string exc_lower = toLower(exclusion);
    while (exc_lower.size() > 1 &&
           (exc_lower.back() == '/' || exc_lower.back() == '\\')) {
      exc_lower.pop_back();
    }
    if (exc_lower.empty())
      continue;

    if (path_lower == exc_lower)
      return true;

    if (path_lower.size() > exc_lower.size() &&
        path_lower.compare(0, exc_lower.size(), exc_lower) == 0) {
      char next = path_lower[exc_lower.size()];
      // Root exclusion "/" keeps its separator
      if (next == '/' || next == '\\' || exc_lower == "/")
        return true;
    }
  }
  return false;
}

std::vector<ClassifiedFile>
Analyzer::filter(const std::vector<ClassifiedFile> &files,
                 const std::vector<Category> &categories, long long min_size,
                 int min_days_old, const std::vector<std::string> &exclusions,
                 std::time_t now) {
  std::vector<ClassifiedFile> filtered;

  for (const auto &item : files) {
    if (!categories.empty() &&
        std::find(categories.begin(), categories.end(), item.category) ==
            categories.end()) {
      continue;
    }

    if (item.file.getFileSize() < min_size)
      continue;

    if (daysSince(item.file.getLastAccessed(), now) < min_days_old)
      continue;

    if (!exclusions.empty() && isExcluded(item.file.getPath(), exclusions))
      continue;

    filtered.push_back(item);
  }

  return filtered;
}

std::vector<ClassifiedFile>
Analyzer::sort(const std::vector<ClassifiedFile> &files, SortKey key,
               bool descending) {
  std::vector<ClassifiedFile> sorted = files;

  auto less = [key](const ClassifiedFile &a, const ClassifiedFile &b) {
    switch (key) {
    case SortKey::LastAccessed:
      return a.file.getLastAccessed() < b.file.getLastAccessed();
    case SortKey::Staleness:
      return a.stalenessScore < b.stalenessScore;
    case SortKey::Name:
      return toLower(a.file.getName()) < toLower(b.file.getName());
    case SortKey::Category:
      return categoryName(a.category) < categoryName(b.category);
    case SortKey::Size:
      break;
    }
    return a.file.getFileSize() < b.file.getFileSize();
  };

  // Swapping the arguments keeps equal elements in input order
  if (descending) {
    std::stable_sort(sorted.begin(), sorted.end(),
                     [&less](const ClassifiedFile &a, const ClassifiedFile &b) {
                       return less(b, a);
                     });
  } else {
    std::stable_sort(sorted.begin(), sorted.end(), less);
  }

  return sorted;
}
