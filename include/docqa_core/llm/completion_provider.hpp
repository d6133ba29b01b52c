#pragma once

#include <string>

namespace docqa_core {

class CompletionProvider {
 public:
  virtual ~CompletionProvider() = default;

  virtual std::string complete(const std::string &system_prompt, const std::string &user_prompt) = 0;
};

}  // namespace docqa_core
