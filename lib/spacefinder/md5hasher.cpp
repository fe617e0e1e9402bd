/**
 * @file md5hasher.cpp
 * @brief Implementation of the OpenSSL based MD5 hash calculator
 */

#include "md5hasher.hpp"

#include <array>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

#include <openssl/evp.h>

namespace {

struct EvpContextDeleter {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

using EvpContext = std::unique_ptr<EVP_MD_CTX, EvpContextDeleter>;

} // namespace

std::string Md5Hasher::calculateHash(const std::string &filePath) const {
  return digestFile(filePath, 0, false);
}

std::string Md5Hasher::calculatePartialHash(const std::string &filePath,
                                            std::uintmax_t maxBytes) const {
  return digestFile(filePath, maxBytes, true);
}

std::string Md5Hasher::digestFile(const std::string &filePath,
                                  std::uintmax_t maxBytes, bool limited) {
  std::ifstream file(filePath, std::ios::binary);
  if (!file)
    return "";

  EvpContext ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1)
    return "";

  std::array<char, 8192> buffer;
  std::uintmax_t remaining = maxBytes;

  while (!limited || remaining > 0) {
    std::streamsize want = static_cast<std::streamsize>(buffer.size());
    if (limited && remaining < buffer.size())
      want = static_cast<std::streamsize>(remaining);

    file.read(buffer.data(), want);
    std::streamsize got = file.gcount();
    if (got > 0 &&
        EVP_DigestUpdate(ctx.get(), buffer.data(),
                         static_cast<std::size_t>(got)) != 1) {
      return "";
    }
    if (limited)
      remaining -= static_cast<std::uintmax_t>(got);
    if (got < want)
      break;
  }

  if (file.bad())
    return "";

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1)
    return "";

  std::ostringstream ss;
  ss << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < length; ++i) {
    ss << std::setw(2) << static_cast<int>(digest[i]);
  }
  return ss.str();
}
