#ifndef IHASHCALCULATOR_HPP
#define IHASHCALCULATOR_HPP

#include <cstdint>
#include <string>

/**
 * @brief Content hash strategy used by the DuplicateFinder
 *
 * Both methods return the digest as a fixed-length hex string, or an empty
 * string if the file cannot be opened or read. Implementations must close
 * the file before returning.
 */
class IHashCalculator {
public:
    /** @brief Hash of the entire file content */
    virtual std::string calculateHash(const std::string& filePath) const = 0;

    /** @brief Hash of at most the first @p maxBytes bytes of the file */
    virtual std::string calculatePartialHash(const std::string& filePath,
                                             std::uintmax_t maxBytes) const = 0;

    virtual ~IHashCalculator() = default;
};

#endif // IHASHCALCULATOR_HPP
