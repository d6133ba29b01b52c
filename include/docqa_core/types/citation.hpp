#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "docqa_core/types/file.hpp"

namespace docqa_core {

struct Citation {
  int id = 0;  // 1-based, order of appearance in the context
  std::string doc_id;
  int chunk_id = 0;
  std::string filename;
  FileType file_type = FileType::Unknown;
  std::string text;
  float score = 0.0f;
  bool mentioned_in_answer = false;
};

enum class AnswerStatus { Answered, NoResults, NoContext, GenerationFailed };

std::string to_string(AnswerStatus status);

struct AnswerRecord {
  std::string answer;
  float confidence = 0.0f;
  std::vector<Citation> citations;
  int context_used = 0;
  AnswerStatus status = AnswerStatus::Answered;
  bool low_confidence = false;
  std::vector<std::string> follow_up_questions;
};

void to_json(nlohmann::json& j, const Citation& citation);
void to_json(nlohmann::json& j, const AnswerRecord& record);

}  // namespace docqa_core
