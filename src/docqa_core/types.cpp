#include "docqa_core/types.hpp"

#include <stdexcept>

namespace docqa_core {

std::string to_string(FileType type) {
  switch (type) {
    case FileType::PDF:
      return "pdf";
    case FileType::Markdown:
      return "md";
    case FileType::Text:
      return "txt";
    default:
      return "unknown";
  }
}

FileType file_type_from_string(const std::string& str) {
  if (str == "pdf")
    return FileType::PDF;
  if (str == "md")
    return FileType::Markdown;
  if (str == "txt")
    return FileType::Text;
  return FileType::Unknown;
}

std::string to_string(ResultSource source) {
  switch (source) {
    case ResultSource::Semantic:
      return "semantic";
    case ResultSource::Keyword:
      return "keyword";
    case ResultSource::Fused:
      return "fused";
    default:
      return "unknown";
  }
}

std::string to_string(AnswerStatus status) {
  switch (status) {
    case AnswerStatus::Answered:
      return "answered";
    case AnswerStatus::NoResults:
      return "no_results";
    case AnswerStatus::NoContext:
      return "no_context";
    case AnswerStatus::GenerationFailed:
      return "generation_failed";
    default:
      return "unknown";
  }
}

void validate_chunk(const Chunk& chunk) {
  if (chunk.doc_id.empty()) {
    throw std::invalid_argument("Chunk " + std::to_string(chunk.chunk_id) +
                                " has no doc_id");
  }
  if (chunk.text.empty()) {
    throw std::invalid_argument("Chunk " + std::to_string(chunk.chunk_id) + " of document " +
                                chunk.doc_id + " has empty text");
  }
}

void to_json(nlohmann::json& j, const SearchResult& result) {
  j = nlohmann::json{{"chunk_id", result.chunk_id},
                     {"doc_id", result.doc_id},
                     {"text", result.text},
                     {"filename", result.filename},
                     {"file_type", to_string(result.file_type)},
                     {"score", result.score},
                     {"source", to_string(result.source)}};
}

void to_json(nlohmann::json& j, const FusedResult& result) {
  to_json(j, static_cast<const SearchResult&>(result));
  j["combined_score"] = result.combined_score;
}

void to_json(nlohmann::json& j, const Citation& citation) {
  j = nlohmann::json{{"id", citation.id},
                     {"doc_id", citation.doc_id},
                     {"chunk_id", citation.chunk_id},
                     {"filename", citation.filename},
                     {"file_type", to_string(citation.file_type)},
                     {"text", citation.text},
                     {"score", citation.score},
                     {"mentioned_in_answer", citation.mentioned_in_answer}};
}

void to_json(nlohmann::json& j, const AnswerRecord& record) {
  j = nlohmann::json{{"answer", record.answer},
                     {"confidence", record.confidence},
                     {"citations", record.citations},
                     {"context_used", record.context_used},
                     {"status", to_string(record.status)},
                     {"low_confidence", record.low_confidence},
                     {"follow_up_questions", record.follow_up_questions}};
}

}  // namespace docqa_core
