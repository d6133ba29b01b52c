#pragma once

#include <string>
#include <vector>

#include "docqa_core/types/citation.hpp"

namespace docqa_core {

struct CitationOutcome {
  std::vector<Citation> citations;
  // Set when no usable marker was found and citations holds every available citation
  bool degraded = false;
};

// Maps "[Source N]" markers in an answer back to the citations built for its context
class CitationProcessor {
 public:
  // Markers are deduplicated, numbers outside 1..available.size() are ignored, and the result
  // is ordered by citation id.
  CitationOutcome extract(const std::string &answer,
                          const std::vector<Citation> &available_citations) const;

  // Distinct marker numbers in order of first appearance. Unrepresentable numbers are skipped.
  static std::vector<size_t> parse_markers(const std::string &answer);
};

}  // namespace docqa_core
