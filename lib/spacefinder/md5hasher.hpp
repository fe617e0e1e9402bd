/**
 * @file md5hasher.hpp
 * @brief MD5 content hashing backed by OpenSSL's EVP interface
 */

#ifndef MD5HASHER_HPP
#define MD5HASHER_HPP

#include "ihashcalculator.hpp"

/**
 * @brief IHashCalculator producing 32-character lower-case MD5 hex digests
 *
 * Used for the full-content confirmation stage of duplicate detection. MD5
 * serves as an identity check for files already matched by size and partial
 * hash, not as a security boundary.
 *
 * Files are read in 8 KiB chunks; the stream is closed when the call returns
 * on every path.
 *
 * @see DuplicateFinder
 */
class Md5Hasher : public IHashCalculator {
public:
  std::string calculateHash(const std::string &filePath) const override;

  std::string calculatePartialHash(const std::string &filePath,
                                   std::uintmax_t maxBytes) const override;

private:
  /**
   * @brief Digests the file, stopping after @p maxBytes when @p limited
   *
   * @return Hex digest, or "" on open/read/OpenSSL failure
   */
  static std::string digestFile(const std::string &filePath,
                                std::uintmax_t maxBytes, bool limited);
};

#endif // MD5HASHER_HPP
