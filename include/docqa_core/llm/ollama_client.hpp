#pragma once

#include <string>
#include <vector>

#include "docqa_core/llm/completion_provider.hpp"
#include "docqa_core/llm/embedding_provider.hpp"

namespace docqa_core {

class OllamaError : public std::exception {
 public:
  explicit OllamaError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct OllamaSettings {
  std::string url = "http://localhost:11434";
  std::string embedding_model = "mxbai-embed-large";
  std::string completion_model = "llama3.1";
  int max_tokens = 500;
  float temperature = 0.1f;
};

class OllamaClient : public EmbeddingProvider, public CompletionProvider {
 public:
  // Throws OllamaError if the server is not reachable
  explicit OllamaClient(const OllamaSettings &settings);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::vector<float> get_embedding(const std::string &text) override;
  std::vector<std::vector<float>> get_embeddings(const std::vector<std::string> &texts) override;

  std::string complete(const std::string &system_prompt, const std::string &user_prompt) override;

  bool is_server_available();

 private:
  OllamaSettings settings_;

  void setup_server_connection();
};

}  // namespace docqa_core
