#ifndef FNV1A_HPP
#define FNV1A_HPP

#include "ihashcalculator.hpp"
#include <array>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <sstream>

/**
 * @brief Implementation of FNV-1a (Fowler-Noll-Vo) hash algorithm
 * 
 * FNV-1a is a non-cryptographic hash function designed for fast hash table lookup.
 * This implementation uses the 64-bit version of the algorithm with:
 * - FNV prime: 2^40 + 2^8 + 0xb3 (1099511628211)
 * - FNV offset basis: 14695981039346656037
 *
 * The DuplicateFinder uses it for the partial-hash stage, where only the
 * first few kilobytes are read and every match is re-checked with a full
 * content hash afterwards.
 * 
 * @note Inherits from IHashCalculator interface
 * 
 * @see http://www.isthe.com/chongo/tech/comp/fnv/
 */
class FNV1A : public IHashCalculator {
public:
  std::string calculateHash(const std::string &filePath) const override {
    return hashFile(filePath, 0, false);
  }

  std::string calculatePartialHash(const std::string &filePath,
                                   std::uintmax_t maxBytes) const override {
    return hashFile(filePath, maxBytes, true);
  }

private:
  static std::string hashFile(const std::string &filePath,
                              std::uintmax_t maxBytes, bool limited) {
    const uint64_t FNV_prime = 1099511628211u;
    uint64_t hash = 14695981039346656037u;

    std::ifstream file(filePath, std::ios::binary);
    
    if (!file)
      return "";

    std::array<char, 8192> buffer;
    std::uintmax_t remaining = maxBytes;

    while (!limited || remaining > 0) {
      std::streamsize want = static_cast<std::streamsize>(buffer.size());
      if (limited && remaining < buffer.size())
        want = static_cast<std::streamsize>(remaining);

      file.read(buffer.data(), want);
      std::streamsize got = file.gcount();
      for (std::streamsize i = 0; i < got; ++i) {
        hash ^= static_cast<unsigned char>(buffer[static_cast<std::size_t>(i)]);
        hash *= FNV_prime;
      }
      if (limited)
        remaining -= static_cast<std::uintmax_t>(got);
      if (got < want)
        break;
    }

    // Stopped by a read error rather than end of file
    if (file.bad())
      return "";

    std::stringstream ss;
    ss << std::hex << std::setw(16) << std::setfill('0') << hash;

    return ss.str();
  }
};

#endif // FNV1A_HPP
