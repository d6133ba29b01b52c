#include "docqa_core/chunking/tokenizer.hpp"

#include <utf8.h>

#include <cctype>
#include <cstdint>
#include <string>

#include "docqa_core/utils/text_utils.hpp"

namespace docqa_core {

namespace {

enum class RunKind { None, Letter, Digit, Punct, Space };

RunKind classify(uint32_t cp) {
  if (cp >= 0x80) {
    // Non-ASCII code points are treated as word characters
    return RunKind::Letter;
  }
  unsigned char c = static_cast<unsigned char>(cp);
  if (std::isspace(c))
    return RunKind::Space;
  if (std::isalpha(c))
    return RunKind::Letter;
  if (std::isdigit(c))
    return RunKind::Digit;
  return RunKind::Punct;
}

size_t run_cost(RunKind kind, size_t length) {
  switch (kind) {
    case RunKind::Letter:
      return (length + HeuristicTokenizer::LETTERS_PER_TOKEN - 1) /
             HeuristicTokenizer::LETTERS_PER_TOKEN;
    case RunKind::Digit:
      return (length + HeuristicTokenizer::DIGITS_PER_TOKEN - 1) /
             HeuristicTokenizer::DIGITS_PER_TOKEN;
    case RunKind::Punct:
      return length;
    default:
      return 0;
  }
}

}  // namespace

size_t HeuristicTokenizer::count_tokens(std::string_view text) const {
  if (text.empty()) {
    return 0;
  }
  const std::string clean = text_utils::sanitize_utf8(text);

  size_t tokens = 0;
  RunKind current = RunKind::None;
  size_t run_length = 0;

  auto it = clean.begin();
  while (it != clean.end()) {
    uint32_t cp = utf8::next(it, clean.end());
    RunKind kind = classify(cp);
    if (kind != current) {
      tokens += run_cost(current, run_length);
      current = kind;
      run_length = 0;
    }
    ++run_length;
  }
  tokens += run_cost(current, run_length);
  return tokens;
}

}  // namespace docqa_core
