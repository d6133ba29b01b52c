#pragma once

#include <string>
#include <vector>

namespace docqa_core {

class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual std::vector<float> get_embedding(const std::string &text) = 0;

  // One vector per input, in input order. Fails as a whole.
  virtual std::vector<std::vector<float>> get_embeddings(const std::vector<std::string> &texts) = 0;
};

}  // namespace docqa_core
