#include "../include/filehasher.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

namespace kirei {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

void update(EVP_MD_CTX *ctx, const char *data, std::size_t size,
            const std::filesystem::path &file) {
  if (size == 0) return;
  if (EVP_DigestUpdate(ctx, data, size) != 1) {
    throw std::runtime_error("Failed to update SHA256 digest for " +
                             file.string());
  }
}

}  // namespace

std::string FileHasher::sha256(const std::filesystem::path &file) const {
  std::ifstream input(file, std::ios::binary);
  if (!input) {
    throw std::runtime_error("Cannot open file for hashing: " + file.string());
  }

  DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) {
    throw std::runtime_error("Failed to create EVP context");
  }

  const EVP_MD *md = EVP_sha256();
  const auto hash_size = static_cast<unsigned int>(EVP_MD_size(md));
  if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
    throw std::runtime_error("Failed to initialize SHA256 digest");
  }

  std::error_code ec;
  const auto size = std::filesystem::file_size(file, ec);

  if (!ec && size <= kSmallFileThreshold) {
    std::vector<char> content((std::istreambuf_iterator<char>(input)),
                              std::istreambuf_iterator<char>());
    if (input.bad()) {
      throw std::runtime_error("Read error while hashing " + file.string());
    }
    update(ctx.get(), content.data(), content.size(), file);
  } else {
    char buffer[kChunkSize];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
      if (cancelled_ != nullptr && cancelled_->load()) {
        throw HashCancelled("Hashing cancelled: " + file.string());
      }
      update(ctx.get(), buffer, static_cast<std::size_t>(input.gcount()),
             file);
    }
    if (input.bad()) {
      throw std::runtime_error("Read error while hashing " + file.string());
    }
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), hash, &len) != 1 || len != hash_size) {
    throw std::runtime_error("Failed to finalize SHA256 digest");
  }

  std::stringstream ss;
  ss << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < len; i++) {
    ss << std::setw(2) << static_cast<unsigned>(hash[i]);
  }
  return ss.str();
}

}  // namespace kirei
