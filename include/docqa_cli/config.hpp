#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

class Config {
 public:
  std::string ollama_url;
  std::string embedding_model;
  std::string completion_model;
  int embedding_dimension;

  // Chunking
  int chunk_size;
  int chunk_overlap;

  // Retrieval
  int search_top_k;
  float hybrid_alpha;
  float semantic_min_score;

  // Answer generation
  int answer_max_tokens;
  float answer_temperature;
  int max_context_tokens;
  float confidence_threshold;

  long long max_file_size_bytes;

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
      throw std::runtime_error("Config must be a JSON object");
    }

    Config config;

    // Apply defaults when keys are missing
    try {
      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model =
          json_config.value("embedding_model", std::string("mxbai-embed-large"));
      config.completion_model = json_config.value("completion_model", std::string("llama3.1"));
      config.embedding_dimension = json_config.value("embedding_dimension", 1024);

      config.chunk_size = json_config.value("chunk_size", 1000);
      config.chunk_overlap = json_config.value("chunk_overlap", 200);

      config.search_top_k = json_config.value("search_top_k", 5);
      config.hybrid_alpha = json_config.value("hybrid_alpha", 0.5f);
      config.semantic_min_score = json_config.value("semantic_min_score", 0.1f);

      config.answer_max_tokens = json_config.value("answer_max_tokens", 500);
      config.answer_temperature = json_config.value("answer_temperature", 0.1f);
      config.max_context_tokens = json_config.value("max_context_tokens", 3000);
      config.confidence_threshold = json_config.value("confidence_threshold", 0.3f);

      config.max_file_size_bytes = json_config.value("max_file_size_bytes", 10LL * 1024 * 1024);
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    config.validate();
    return config;
  }

 private:
  void validate() const {
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (completion_model.empty()) {
      throw std::runtime_error("completion_model cannot be empty");
    }
    if (embedding_dimension <= 0) {
      throw std::runtime_error("embedding_dimension must be greater than 0");
    }
    if (chunk_size <= 0) {
      throw std::runtime_error("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_size) {
      throw std::runtime_error("chunk_overlap must be between 0 and chunk_size - 1");
    }
    if (search_top_k <= 0) {
      throw std::runtime_error("search_top_k must be greater than 0");
    }
    if (!(hybrid_alpha >= 0.0f && hybrid_alpha <= 1.0f)) {
      throw std::runtime_error("hybrid_alpha must be within [0, 1]");
    }
    if (!(semantic_min_score >= -1.0f && semantic_min_score <= 1.0f)) {
      throw std::runtime_error("semantic_min_score must be within [-1, 1]");
    }
    if (answer_max_tokens <= 0) {
      throw std::runtime_error("answer_max_tokens must be greater than 0");
    }
    if (!(answer_temperature >= 0.0f && answer_temperature <= 2.0f)) {
      throw std::runtime_error("answer_temperature must be within [0, 2]");
    }
    if (max_context_tokens <= 0) {
      throw std::runtime_error("max_context_tokens must be greater than 0");
    }
    if (!(confidence_threshold >= 0.0f && confidence_threshold <= 1.0f)) {
      throw std::runtime_error("confidence_threshold must be within [0, 1]");
    }
    if (max_file_size_bytes <= 0) {
      throw std::runtime_error("max_file_size_bytes must be greater than 0");
    }
  }
};
