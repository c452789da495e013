#pragma once

#include <filesystem>
#include <string>

namespace ragdex_core {

class DirectoryHasher {
 public:
  /**
   * @brief SHA-256 over the contents of every regular file below a directory.
   *
   * Each file's content is hashed, the hex digests are sorted, and the
   * concatenation is hashed again. File names do not contribute, so renaming a
   * file keeps the hash; adding, removing or editing one changes it.
   *
   * @throw IndexCacheError if the path is not a readable directory.
   */
  static std::string hash_directory(const std::filesystem::path &directory);

  static std::string hash_file(const std::filesystem::path &file_path);

  static std::string hash_string(const std::string &content);
};

}  // namespace ragdex_core
