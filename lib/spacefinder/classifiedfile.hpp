/**
 * @file classifiedfile.hpp
 * @brief File categories and the analyzed file record
 *
 * ClassifiedFile pairs a FileInfo with the attributes the Analyzer derives
 * from it. The derived values are a snapshot: they are not refreshed when the
 * file on disk changes, callers re-run Analyzer::analyze() for that.
 *
 * @see Analyzer
 * @see FileInfo
 */

#ifndef CLASSIFIEDFILE_HPP
#define CLASSIFIEDFILE_HPP

#include <array>
#include <optional>
#include <string>

#include "fileinfo.hpp"
#include "utils.hpp"

/**
 * @enum Category
 * @brief Fixed set of file categories assigned by the Analyzer
 */
enum class Category { Video, Audio, Image, Document, Archive, Code, Game, Other };

/** @brief All categories in display order */
inline constexpr std::array<Category, 8> ALL_CATEGORIES = {
    Category::Video,   Category::Audio, Category::Image, Category::Document,
    Category::Archive, Category::Code,  Category::Game,  Category::Other};

/**
 * @brief Returns the display name of a category ("Video", "Other", ...)
 */
inline std::string categoryName(Category category) {
  switch (category) {
  case Category::Video:
    return "Video";
  case Category::Audio:
    return "Audio";
  case Category::Image:
    return "Image";
  case Category::Document:
    return "Document";
  case Category::Archive:
    return "Archive";
  case Category::Code:
    return "Code";
  case Category::Game:
    return "Game";
  case Category::Other:
    return "Other";
  }
  return "Other";
}

/**
 * @brief Looks up a category by name, ignoring case
 *
 * @param name Category name such as "video" or "Video"
 * @return std::optional<Category> The category, or std::nullopt if unknown
 */
inline std::optional<Category> parseCategory(const std::string &name) {
  const std::string wanted = toLower(name);
  for (Category category : ALL_CATEGORIES) {
    if (toLower(categoryName(category)) == wanted)
      return category;
  }
  return std::nullopt;
}

/**
 * @struct ClassifiedFile
 * @brief A scanned file annotated with its category and staleness score
 */
struct ClassifiedFile {
  FileInfo file;
  Category category = Category::Other;
  double stalenessScore = 0.0;
};

#endif // CLASSIFIEDFILE_HPP
