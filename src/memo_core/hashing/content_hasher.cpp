#include "memo_core/hashing/content_hasher.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

namespace memo_core {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext new_md5_context() {
  DigestContext mdctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!mdctx) {
    throw HashingError("Failed to create EVP context for hashing");
  }
  if (EVP_DigestInit_ex(mdctx.get(), EVP_md5(), nullptr) != 1) {
    throw HashingError("Failed to initialize MD5 digest");
  }
  return mdctx;
}

std::string finalize_hex(EVP_MD_CTX* mdctx) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
    throw HashingError("Failed to finalize MD5 digest");
  }

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

}  // namespace

Fingerprint ContentHasher::fingerprint(const std::filesystem::path& file_path) const {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw HashingError("Could not open file for hashing: " + file_path.string());
  }

  DigestContext mdctx = new_md5_context();
  std::vector<char> buffer(READ_BUFFER_SIZE);
  while (file_stream) {
    file_stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize got = file_stream.gcount();
    if (got > 0 && EVP_DigestUpdate(mdctx.get(), buffer.data(), static_cast<size_t>(got)) != 1) {
      throw HashingError("Failed to update MD5 digest for " + file_path.string());
    }
  }
  // eof sets failbit too; only badbit means the read itself broke
  if (file_stream.bad()) {
    throw HashingError("Read error while hashing " + file_path.string());
  }

  return finalize_hex(mdctx.get());
}

Fingerprint ContentHasher::fingerprint_bytes(const std::string& content) const {
  DigestContext mdctx = new_md5_context();
  if (EVP_DigestUpdate(mdctx.get(), content.data(), content.length()) != 1) {
    throw HashingError("Failed to update MD5 digest");
  }
  return finalize_hex(mdctx.get());
}

}  // namespace memo_core
