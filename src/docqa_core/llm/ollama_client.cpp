#include "docqa_core/llm/ollama_client.hpp"

#include "ollama.hpp"

namespace docqa_core {

OllamaClient::OllamaClient(const OllamaSettings &settings) : settings_(settings) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  ollama::setServerURL(settings_.url);
  if (!ollama::is_running()) {
    throw OllamaError("Ollama server is not running at " + settings_.url);
  }
}

std::vector<float> OllamaClient::get_embedding(const std::string &text) {
  try {
    ollama::response response = ollama::generate_embeddings(settings_.embedding_model, text);

    auto json_response = response.as_json();
    if (!json_response.contains("embeddings")) {
      throw OllamaError("Response does not contain embedding field");
    }

    // Handle different embedding response formats
    auto embeddings = json_response["embeddings"];
    if (embeddings.is_array()) {
      if (embeddings.size() > 0 && embeddings[0].is_array()) {
        // Array of arrays - take the first embedding vector
        return embeddings[0].get<std::vector<float>>();
      } else {
        return embeddings.get<std::vector<float>>();
      }
    } else {
      throw OllamaError("Embeddings field is not an array");
    }

  } catch (const ollama::exception &e) {
    throw OllamaError("Embedding generation failed: " + std::string(e.what()));
  }
}

std::vector<std::vector<float>> OllamaClient::get_embeddings(
    const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> embeddings;
  embeddings.reserve(texts.size());
  for (const auto &text : texts) {
    // Any failure propagates, no partial batch is returned
    embeddings.push_back(get_embedding(text));
  }
  return embeddings;
}

std::string OllamaClient::complete(const std::string &system_prompt,
                                   const std::string &user_prompt) {
  ollama::options options;
  options["temperature"] = settings_.temperature;
  options["num_predict"] = settings_.max_tokens;

  const std::string prompt = system_prompt + "\n\n" + user_prompt;
  try {
    ollama::response response = ollama::generate(settings_.completion_model, prompt, options);
    return response.as_simple_string();
  } catch (const ollama::exception &e) {
    throw OllamaError("Completion failed: " + std::string(e.what()));
  }
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

}  // namespace docqa_core
