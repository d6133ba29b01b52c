#pragma once

#include <string>

namespace docqa_core {

// Source document type of an ingested file
enum class FileType { PDF, Markdown, Text, Unknown };

// Conversion utilities, using the short extension names ("pdf", "md", "txt")
std::string to_string(FileType type);
FileType file_type_from_string(const std::string& str);

}  // namespace docqa_core
