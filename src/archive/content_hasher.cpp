#include "attic/archive/content_hasher.hpp"

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

#include <openssl/evp.h>

namespace attic::archive {

namespace {

struct EvpMdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

}  // namespace

Result<std::string> ContentHasher::computeHash(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Cannot open file for hashing: " + path.string()));
  }

  std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    return std::unexpected(makeError(ErrorCode::kUnknownError, "SHA-256 initialisation failed"));
  }

  std::vector<char> buffer(kChunkSize);
  while (file) {
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize n = file.gcount();
    if (n > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(n)) != 1) {
      return std::unexpected(makeError(ErrorCode::kUnknownError, "SHA-256 update failed"));
    }
  }
  if (file.bad()) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Read error while hashing: " + path.string()));
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
    return std::unexpected(makeError(ErrorCode::kUnknownError, "SHA-256 finalisation failed"));
  }

  std::ostringstream hex;
  hex << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < digest_len; ++i) {
    hex << std::setw(2) << static_cast<int>(digest[i]);
  }
  return hex.str();
}

bool ContentHasher::isValidHash(const std::string& value) {
  if (value.size() != 64) {
    return false;
  }
  for (char c : value) {
    bool digit = c >= '0' && c <= '9';
    bool lower = c >= 'a' && c <= 'f';
    if (!digit && !lower) {
      return false;
    }
  }
  return true;
}

}  // namespace attic::archive
