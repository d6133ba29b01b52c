#pragma once

#include <string>

#include "docqa_core/types/file.hpp"

namespace docqa_core {

struct Chunk {
  int chunk_id = 0;
  std::string doc_id;
  std::string text;
  int token_count = 0;
  int char_count = 0;
  int start_sentence = 0;
  int end_sentence = 0;
  std::string filename;
  FileType file_type = FileType::Unknown;
};

// Throws std::invalid_argument when the chunk cannot be indexed (empty text or doc_id)
void validate_chunk(const Chunk& chunk);

}  // namespace docqa_core
