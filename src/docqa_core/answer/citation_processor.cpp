#include "docqa_core/answer/citation_processor.hpp"

#include <algorithm>
#include <charconv>
#include <iostream>
#include <regex>
#include <unordered_set>

namespace docqa_core {

std::vector<size_t> CitationProcessor::parse_markers(const std::string &answer) {
  static const std::regex marker_regex(R"(\[Source (\d+)\])");

  std::vector<size_t> numbers;
  std::unordered_set<size_t> seen;
  for (auto it = std::sregex_iterator(answer.begin(), answer.end(), marker_regex);
       it != std::sregex_iterator(); ++it) {
    const std::string digits = (*it)[1].str();
    size_t number = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), number);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
      continue;
    }
    if (seen.insert(number).second) {
      numbers.push_back(number);
    }
  }
  return numbers;
}

CitationOutcome CitationProcessor::extract(const std::string &answer,
                                           const std::vector<Citation> &available_citations) const {
  CitationOutcome outcome;
  try {
    for (size_t number : parse_markers(answer)) {
      // Numbers come from model output and are bounds-checked before use
      if (number >= 1 && number <= available_citations.size()) {
        Citation citation = available_citations[number - 1];
        citation.mentioned_in_answer = true;
        outcome.citations.push_back(std::move(citation));
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "[CitationProcessor] Failed to parse citations: " << e.what() << std::endl;
    outcome.citations.clear();
  }

  if (outcome.citations.empty()) {
    outcome.citations = available_citations;
    for (auto &citation : outcome.citations) {
      citation.mentioned_in_answer = false;
    }
    outcome.degraded = true;
    return outcome;
  }

  std::sort(outcome.citations.begin(), outcome.citations.end(),
            [](const Citation &a, const Citation &b) { return a.id < b.id; });
  std::cout << "[CitationProcessor] Matched " << outcome.citations.size() << " of "
            << available_citations.size() << " citations" << std::endl;
  return outcome;
}

}  // namespace docqa_core
