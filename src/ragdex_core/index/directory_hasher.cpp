#include "ragdex_core/index/directory_hasher.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

#include "ragdex_core/index/index_cache.hpp"

namespace ragdex_core {

namespace {

class Sha256 {
 public:
  Sha256() : mdctx_(EVP_MD_CTX_new()) {
    if (!mdctx_) {
      throw IndexCacheError("Failed to create EVP context for hashing");
    }
    if (EVP_DigestInit_ex(mdctx_, EVP_sha256(), nullptr) != 1) {
      EVP_MD_CTX_free(mdctx_);
      throw IndexCacheError("Failed to initialize SHA256 digest");
    }
  }

  ~Sha256() {
    EVP_MD_CTX_free(mdctx_);
  }

  Sha256(const Sha256 &) = delete;
  Sha256 &operator=(const Sha256 &) = delete;

  void update(const char *data, size_t length) {
    if (EVP_DigestUpdate(mdctx_, data, length) != 1) {
      throw IndexCacheError("Failed to update SHA256 digest");
    }
  }

  std::string final_hex() {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len;
    if (EVP_DigestFinal_ex(mdctx_, hash, &hash_len) != 1) {
      throw IndexCacheError("Failed to finalize SHA256 digest");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < hash_len; i++) {
      ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
  }

 private:
  EVP_MD_CTX *mdctx_;
};

constexpr size_t kReadBlockSize = 64 * 1024;

}  // namespace

std::string DirectoryHasher::hash_string(const std::string &content) {
  Sha256 sha;
  sha.update(content.data(), content.size());
  return sha.final_hex();
}

std::string DirectoryHasher::hash_file(const std::filesystem::path &file_path) {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw IndexCacheError("Could not open file for hashing: " + file_path.string());
  }

  Sha256 sha;
  std::vector<char> buffer(kReadBlockSize);
  while (file_stream) {
    file_stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize read = file_stream.gcount();
    if (read > 0) {
      sha.update(buffer.data(), static_cast<size_t>(read));
    }
  }
  if (file_stream.bad()) {
    throw IndexCacheError("Failed reading file for hashing: " + file_path.string());
  }
  return sha.final_hex();
}

std::string DirectoryHasher::hash_directory(const std::filesystem::path &directory) {
  std::error_code ec;
  if (!std::filesystem::is_directory(directory, ec)) {
    throw IndexCacheError(directory.string() + " is not a directory");
  }

  std::vector<std::string> file_hashes;
  try {
    for (const auto &entry : std::filesystem::recursive_directory_iterator(directory)) {
      if (entry.is_regular_file()) {
        file_hashes.push_back(hash_file(entry.path()));
      }
    }
  } catch (const std::filesystem::filesystem_error &e) {
    throw IndexCacheError("Failed to hash directory " + directory.string() + ": " + e.what());
  }

  std::sort(file_hashes.begin(), file_hashes.end());
  Sha256 sha;
  for (const auto &file_hash : file_hashes) {
    sha.update(file_hash.data(), file_hash.size());
  }
  return sha.final_hex();
}

}  // namespace ragdex_core
