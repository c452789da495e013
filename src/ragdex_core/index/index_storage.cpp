#include "ragdex_core/index/index_storage.hpp"

#include <faiss/impl/FaissException.h>
#include <faiss/index_io.h>

#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <utility>

namespace ragdex_core {

namespace fs = std::filesystem;

namespace {

void write_text_file(const fs::path &path, const std::string &content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    throw IndexStorageError("Could not open " + path.string() + " for writing");
  }
  out << content;
  out.flush();
  if (!out) {
    throw IndexStorageError("Failed writing " + path.string());
  }
}

std::string read_text_file(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw IndexStorageError("Could not open " + path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

}  // namespace

IndexStorage::IndexStorage(fs::path save_dir) : save_dir_(std::move(save_dir)) {
  save_dir_ = save_dir_.lexically_normal();
  // a trailing separator leaves an empty filename
  if (save_dir_.filename().empty() && save_dir_.has_parent_path()) {
    save_dir_ = save_dir_.parent_path();
  }
  if (save_dir_.empty()) {
    throw IndexStorageError("Index save directory cannot be empty");
  }
}

bool IndexStorage::exists() const {
  restore_previous();
  std::error_code ec;
  return fs::exists(save_dir_, ec);
}

bool IndexStorage::is_complete() const {
  std::error_code ec;
  return fs::is_regular_file(save_dir_ / INDEX_FILE, ec) &&
         fs::is_regular_file(save_dir_ / DOCUMENTS_FILE, ec);
}

bool IndexStorage::has_hash_marker() const {
  std::error_code ec;
  return fs::is_regular_file(save_dir_ / HASH_MARKER_FILE, ec);
}

std::string IndexStorage::read_hash_marker() const {
  return read_text_file(save_dir_ / HASH_MARKER_FILE);
}

void IndexStorage::save(const VectorIndex &index, const std::string &hash_marker) const {
  const fs::path staging = sibling(".staging");
  try {
    if (save_dir_.has_parent_path()) {
      fs::create_directories(save_dir_.parent_path());
    }
    fs::remove_all(staging);
    fs::create_directory(staging);
  } catch (const fs::filesystem_error &e) {
    throw IndexStorageError("Failed to prepare staging directory: " + std::string(e.what()));
  }

  try {
    faiss::write_index(&index.faiss_index(), (staging / INDEX_FILE).string().c_str());
  } catch (const faiss::FaissException &e) {
    throw IndexStorageError("Failed to write faiss index: " + std::string(e.what()));
  }

  nlohmann::json documents = index.documents();
  write_text_file(staging / DOCUMENTS_FILE, documents.dump());
  write_text_file(staging / HASH_MARKER_FILE, hash_marker);

  publish(staging);
  std::cout << "index with " << index.size() << " entries saved to " << save_dir_.string()
            << std::endl;
}

VectorIndex IndexStorage::load() const {
  if (!exists()) {
    throw IndexNotFoundError("index not found @ " + save_dir_.string());
  }

  const fs::path index_path = save_dir_ / INDEX_FILE;
  const fs::path documents_path = save_dir_ / DOCUMENTS_FILE;
  std::error_code ec;
  if (!fs::is_regular_file(index_path, ec)) {
    throw IndexStorageError("Incomplete index @ " + save_dir_.string() + ": missing " +
                            INDEX_FILE);
  }
  if (!fs::is_regular_file(documents_path, ec)) {
    throw IndexStorageError("Incomplete index @ " + save_dir_.string() + ": missing " +
                            DOCUMENTS_FILE);
  }

  std::unique_ptr<faiss::Index> raw_index;
  try {
    raw_index.reset(faiss::read_index(index_path.string().c_str()));
  } catch (const faiss::FaissException &e) {
    throw IndexStorageError("Failed to read faiss index: " + std::string(e.what()));
  }

  auto *flat = dynamic_cast<faiss::IndexFlatIP *>(raw_index.get());
  if (!flat) {
    throw IndexStorageError(index_path.string() + " is not a flat inner-product index");
  }
  std::unique_ptr<faiss::IndexFlatIP> flat_index(flat);
  raw_index.release();

  std::vector<std::string> documents;
  try {
    nlohmann::json parsed = nlohmann::json::parse(read_text_file(documents_path));
    if (!parsed.is_array()) {
      throw IndexStorageError(documents_path.string() + " is not a JSON array");
    }
    documents = parsed.get<std::vector<std::string>>();
  } catch (const nlohmann::json::exception &e) {
    throw IndexStorageError("Failed to parse " + documents_path.string() + ": " + e.what());
  }

  try {
    VectorIndex index(std::move(flat_index), std::move(documents));
    std::cout << "index with " << index.size() << " entries loaded from " << save_dir_.string()
              << std::endl;
    return index;
  } catch (const VectorIndexError &e) {
    throw IndexStorageError("Corrupt index @ " + save_dir_.string() + ": " + e.what());
  }
}

fs::path IndexStorage::sibling(const std::string &suffix) const {
  fs::path path = save_dir_;
  path += suffix;
  return path;
}

void IndexStorage::publish(const fs::path &staging) const {
  const fs::path previous = sibling(".previous");
  try {
    restore_previous();
    fs::remove_all(previous);
    if (fs::exists(save_dir_)) {
      move_directory(save_dir_, previous);
    }
  } catch (const fs::filesystem_error &e) {
    throw IndexStorageError("Failed to publish index to " + save_dir_.string() + ": " + e.what());
  }

  try {
    move_directory(staging, save_dir_);
  } catch (const fs::filesystem_error &e) {
    std::error_code ec;
    if (fs::exists(previous, ec) && !fs::exists(save_dir_, ec)) {
      fs::rename(previous, save_dir_, ec);
    }
    if (ec) {
      throw IndexStorageError("Failed to publish index to " + save_dir_.string() + ": " +
                              e.what() + "; previous index left at " + previous.string());
    }
    throw IndexStorageError("Failed to publish index to " + save_dir_.string() + ": " + e.what());
  }

  std::error_code ec;
  fs::remove_all(previous, ec);
  if (ec) {
    std::cerr << "Warning: could not remove " << previous.string() << ": " << ec.message()
              << std::endl;
  }
}

void IndexStorage::move_directory(const fs::path &from, const fs::path &to) const {
  fs::rename(from, to);
}

// A publish interrupted between its two renames leaves the last good index in .previous
void IndexStorage::restore_previous() const {
  const fs::path previous = sibling(".previous");
  std::error_code ec;
  if (fs::exists(save_dir_, ec) || !fs::is_directory(previous, ec)) {
    return;
  }
  fs::rename(previous, save_dir_, ec);
  if (ec) {
    throw IndexStorageError("Failed to restore index from " + previous.string() + ": " +
                            ec.message());
  }
  std::cerr << "Warning: restored index from interrupted publish at " << previous.string()
            << std::endl;
}

}  // namespace ragdex_core
