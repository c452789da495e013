#pragma once

#include <filesystem>
#include <string>

#include "ragdex_core/index/vector_index.hpp"

namespace ragdex_core {

class IndexStorageError : public std::exception {
 public:
  explicit IndexStorageError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class IndexNotFoundError : public IndexStorageError {
 public:
  explicit IndexNotFoundError(const std::string &message) : IndexStorageError(message) {}
};

/*
Owns the on-disk layout of a persisted index:

  <save_dir>/index.faiss    faiss IndexFlatIP
  <save_dir>/index.json     JSON array of chunk texts, entry i <-> vector i
  <save_dir>/last_hash.txt  concatenated local directory hashes

The three files are written into <save_dir>.staging and published together by
renaming the directory, so readers never observe a partially written index. The
index being replaced is parked in <save_dir>.previous until the new one is in
place; a publish that fails midway moves it back, and a leftover .previous with no
<save_dir> beside it is restored on the next access.
Concurrent writers against the same save_dir are not supported.
*/
class IndexStorage {
 public:
  static constexpr const char *INDEX_FILE = "index.faiss";
  static constexpr const char *DOCUMENTS_FILE = "index.json";
  static constexpr const char *HASH_MARKER_FILE = "last_hash.txt";

  explicit IndexStorage(std::filesystem::path save_dir);
  virtual ~IndexStorage() = default;

  // True when the save directory exists at all
  bool exists() const;

  // True when both the index and the document list are present
  bool is_complete() const;

  bool has_hash_marker() const;
  std::string read_hash_marker() const;

  void save(const VectorIndex &index, const std::string &hash_marker) const;

  VectorIndex load() const;

  const std::filesystem::path &save_dir() const {
    return save_dir_;
  }

 protected:
  // Single directory rename; throws std::filesystem::filesystem_error
  virtual void move_directory(const std::filesystem::path &from,
                              const std::filesystem::path &to) const;

 private:
  std::filesystem::path save_dir_;

  std::filesystem::path sibling(const std::string &suffix) const;
  void publish(const std::filesystem::path &staging) const;
  void restore_previous() const;
};

}  // namespace ragdex_core
