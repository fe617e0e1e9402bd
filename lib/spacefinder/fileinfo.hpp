#ifndef FILE_INFO_HPP
#define FILE_INFO_HPP

#include <ctime>
#include <filesystem>
#include <string>

#include "utils.hpp"

class FileInfo {
private:
  std::string m_path;
  std::string m_name;
  long long m_size;
  std::time_t m_lastAccessed;
  std::time_t m_lastModified;
  std::string m_extension;

public:
  FileInfo(const std::string &p, long long s, std::time_t accessed,
           std::time_t modified)
      : m_path(p), m_name(std::filesystem::path(p).filename().string()),
        m_size(s < 0 ? 0 : s), m_lastAccessed(accessed),
        m_lastModified(modified) {
    // Extension is fixed at creation: ".tar.gz" -> ".gz", ".bashrc" -> ""
    m_extension = toLower(std::filesystem::path(m_name).extension().string());
  }

  const std::string &getPath() const { return m_path; }
  const std::string &getName() const { return m_name; }
  long long getFileSize() const { return m_size; }
  std::time_t getLastAccessed() const { return m_lastAccessed; }
  std::time_t getLastModified() const { return m_lastModified; }
  const std::string &getExtension() const { return m_extension; }

  std::string getSizeFormatted() const { return formatBytes(m_size); }

  std::string getParentPath() const {
    return std::filesystem::path(m_path).parent_path().string();
  }

  /** @brief Empty files are never duplicate candidates */
  bool zeroFiles() const { return m_size == 0; }
};

#endif // FILE_INFO_HPP
