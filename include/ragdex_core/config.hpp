#pragma once

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ragdex_core {

class Config {
 public:
  // Characters shared by consecutive chunks; the effective chunk length must exceed it
  static constexpr int CHUNK_OVERLAP = 40;

  // Chunking
  int index_text_chunk_len = 0;
  int embedding_model_max_len = 512;

  // Ingestion sources
  std::vector<std::string> index_urls;
  std::vector<std::string> index_local_data_dirs;

  // Persisted index location
  std::string index_save_dir;

  // Model services
  std::string embedding_service_url;
  std::string generation_service_url;
  int completion_n_predict = 256;
  double completion_temperature = 0.0;
  std::vector<std::string> completion_stop;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Config root must be a JSON object");
    }

    Config config;

    config.index_text_chunk_len = read_int(json_config, "index_text_chunk_len", 0);
    config.embedding_model_max_len = read_int(json_config, "embedding_model_max_len", 512);

    config.index_urls = read_string_list(json_config, "index_urls");
    config.index_local_data_dirs = read_string_list(json_config, "index_local_data_dirs");

    config.index_save_dir = read_string(json_config, "index_save_dir", "./data/index");

    config.embedding_service_url =
        read_string(json_config, "embedding_service_url", "http://127.0.0.1:8080");
    config.generation_service_url =
        read_string(json_config, "generation_service_url", "http://127.0.0.1:8081");
    config.completion_n_predict = read_int(json_config, "completion_n_predict", 256);
    config.completion_temperature = read_double(json_config, "completion_temperature", 0.0);
    config.completion_stop = read_string_list(json_config, "completion_stop");

    config.validate();
    return config;
  }

  // Chunk length actually used: the configured length when it is positive and below the
  // embedding model's maximum input length, otherwise the model maximum.
  size_t effective_chunk_len() const {
    if (index_text_chunk_len > 0 && index_text_chunk_len < embedding_model_max_len) {
      return static_cast<size_t>(index_text_chunk_len);
    }
    return static_cast<size_t>(embedding_model_max_len);
  }

 private:
  static int read_int(const nlohmann::json& json_config, const std::string& key, int fallback) {
    if (!json_config.contains(key)) {
      return fallback;
    }
    const auto& value = json_config.at(key);
    if (!value.is_number_integer()) {
      throw std::runtime_error(key + " must be an integer");
    }
    return value.get<int>();
  }

  static double read_double(const nlohmann::json& json_config, const std::string& key,
                            double fallback) {
    if (!json_config.contains(key)) {
      return fallback;
    }
    const auto& value = json_config.at(key);
    if (!value.is_number()) {
      throw std::runtime_error(key + " must be a number");
    }
    return value.get<double>();
  }

  static std::string read_string(const nlohmann::json& json_config, const std::string& key,
                                 const std::string& fallback) {
    if (!json_config.contains(key)) {
      return fallback;
    }
    const auto& value = json_config.at(key);
    if (!value.is_string()) {
      throw std::runtime_error(key + " must be a string");
    }
    return value.get<std::string>();
  }

  static std::vector<std::string> read_string_list(const nlohmann::json& json_config,
                                                   const std::string& key) {
    if (!json_config.contains(key)) {
      return {};
    }
    const auto& value = json_config.at(key);
    if (!value.is_array()) {
      throw std::runtime_error(key + " must be an array of strings");
    }
    std::vector<std::string> out;
    out.reserve(value.size());
    for (const auto& item : value) {
      if (!item.is_string()) {
        throw std::runtime_error(key + " must be an array of strings");
      }
      out.push_back(item.get<std::string>());
    }
    return out;
  }

  void validate() const {
    if (embedding_model_max_len <= 0) {
      throw std::runtime_error("embedding_model_max_len must be greater than 0");
    }
    if (index_text_chunk_len < 0) {
      throw std::runtime_error("index_text_chunk_len cannot be negative");
    }
    if (effective_chunk_len() <= static_cast<size_t>(CHUNK_OVERLAP)) {
      const bool configured =
          index_text_chunk_len > 0 && index_text_chunk_len < embedding_model_max_len;
      throw std::runtime_error(
          std::string(configured ? "index_text_chunk_len" : "embedding_model_max_len") +
          " must be greater than the chunk overlap (" + std::to_string(CHUNK_OVERLAP) + ")");
    }
    if (index_save_dir.empty()) {
      throw std::runtime_error("index_save_dir cannot be empty");
    }
    if (embedding_service_url.empty()) {
      throw std::runtime_error("embedding_service_url cannot be empty");
    }
    if (generation_service_url.empty()) {
      throw std::runtime_error("generation_service_url cannot be empty");
    }
    if (completion_n_predict <= 0) {
      throw std::runtime_error("completion_n_predict must be greater than 0");
    }
  }
};

}  // namespace ragdex_core
