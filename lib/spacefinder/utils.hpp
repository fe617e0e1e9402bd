/**
 * @file utils.hpp
 * @brief Utility functions shared by the library and the command line tool
 *
 * Key utilities:
 * - toLower: ASCII lower-casing used by every case-insensitive match
 * - formatBytes / formatDate: human-readable output
 * - parseSize / parseDays: user input for filter thresholds
 *
 * @see formatBytes()
 * @see parseSize()
 */

#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <exception>
#include <sstream>
#include <string>

/**
 * @brief Returns an ASCII lower-cased copy of a string
 */
inline std::string toLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

/**
 * @brief Formats byte count into human-readable size string
 *
 * Uses binary units (1024 bytes = 1 KB). Precision grows with the unit so
 * that large totals stay readable:
 * - < 1 KB: Returns "N B" (no decimals)
 * - < 1 MB: Returns "X.X KB"
 * - < 1 GB: Returns "X.X MB"
 * - < 1 TB: Returns "X.XX GB"
 * - >= 1 TB: Returns "X.XX TB"
 *
 * @param bytes The number of bytes to format
 *
 * @return std::string Formatted size string (e.g., "1.5 KB", "2.00 GB")
 *
 * Example outputs:
 * - formatBytes(0) → "0 B"
 * - formatBytes(512) → "512 B"
 * - formatBytes(1536) → "1.5 KB"
 * - formatBytes(1073741824) → "1.00 GB"
 */
inline std::string formatBytes(long long bytes) {
  const double kib = 1024.0;
  char buf[32];

  if (bytes < 1024) {
    snprintf(buf, sizeof(buf), "%lld B", bytes);
  } else if (bytes < 1024LL * 1024) {
    snprintf(buf, sizeof(buf), "%.1f KB", bytes / kib);
  } else if (bytes < 1024LL * 1024 * 1024) {
    snprintf(buf, sizeof(buf), "%.1f MB", bytes / (kib * kib));
  } else if (bytes < 1024LL * 1024 * 1024 * 1024) {
    snprintf(buf, sizeof(buf), "%.2f GB", bytes / (kib * kib * kib));
  } else {
    snprintf(buf, sizeof(buf), "%.2f TB", bytes / (kib * kib * kib * kib));
  }
  return std::string(buf);
}

/**
 * @brief Formats a timestamp as local "YYYY-MM-DD HH:MM"
 *
 * @return "Unknown" if the timestamp cannot be converted
 */
inline std::string formatDate(std::time_t timestamp) {
  std::tm tm_buf{};
  if (localtime_r(&timestamp, &tm_buf) == nullptr)
    return "Unknown";

  char buf[32];
  if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm_buf) == 0)
    return "Unknown";
  return std::string(buf);
}

/**
 * @brief Parses a size such as "100 MB" or "2.5kb" into bytes
 *
 * Accepted suffixes (case-insensitive): B, KB, MB, GB, TB. The number may
 * be fractional; the result is truncated to whole bytes.
 *
 * @param text Size string as typed by the user
 *
 * @return long long Number of bytes, or 0 if the text cannot be parsed
 *
 * @note A plain number without a suffix is rejected (returns 0), except "0"
 */
inline long long parseSize(const std::string &text) {
  std::string s = text;
  s.erase(0, s.find_first_not_of(" \t"));
  s.erase(s.find_last_not_of(" \t") + 1);
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  if (s == "0")
    return 0;

  // Two-letter suffixes first so "KB" is not read as "B"
  const struct {
    const char *suffix;
    long long multiplier;
  } units[] = {{"KB", 1024LL},
               {"MB", 1024LL * 1024},
               {"GB", 1024LL * 1024 * 1024},
               {"TB", 1024LL * 1024 * 1024 * 1024},
               {"B", 1LL}};

  for (const auto &unit : units) {
    std::string suffix(unit.suffix);
    if (s.size() >= suffix.size() &&
        s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0) {
      std::string number = s.substr(0, s.size() - suffix.size());
      std::istringstream iss(number);
      double value = 0.0;
      if (!(iss >> value))
        return 0;
      iss >> std::ws;
      if (!iss.eof() || value < 0)
        return 0;
      return static_cast<long long>(value * static_cast<double>(unit.multiplier));
    }
  }
  return 0;
}

/**
 * @brief Parses "30 days" or "30" into a day count, 0 if unparseable
 */
inline int parseDays(const std::string &text) {
  std::istringstream iss(text);
  std::string token;
  if (!(iss >> token))
    return 0;

  try {
    std::size_t used = 0;
    int days = std::stoi(token, &used);
    return used == token.size() ? days : 0;
  } catch (const std::exception &) {
    return 0;
  }
}

#endif // UTILS_HPP
