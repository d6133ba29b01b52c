#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "docqa_core/types/file.hpp"

namespace docqa_core {

enum class ResultSource { Semantic, Keyword, Fused };

std::string to_string(ResultSource source);

struct SearchResult {
  int chunk_id = 0;
  std::string doc_id;
  std::string text;
  std::string filename;
  FileType file_type = FileType::Unknown;
  float score = 0.0f;
  ResultSource source = ResultSource::Semantic;
};

struct FusedResult : public SearchResult {
  float combined_score = 0.0f;
};

void to_json(nlohmann::json& j, const SearchResult& result);
void to_json(nlohmann::json& j, const FusedResult& result);

}  // namespace docqa_core
