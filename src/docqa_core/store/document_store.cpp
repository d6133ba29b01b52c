#include "docqa_core/store/document_store.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "docqa_core/utils/hash_utils.hpp"
#include "docqa_core/utils/text_utils.hpp"

namespace docqa_core {

namespace {

std::string time_point_to_string(const std::chrono::system_clock::time_point &tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::stringstream ss;
  ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%dT%H:%M:%SZ");
  return ss.str();
}

}  // namespace

void to_json(nlohmann::json &j, const Document &document) {
  j = nlohmann::json{{"id", document.doc_id},
                     {"filename", document.filename},
                     {"file_type", to_string(document.file_type)},
                     {"file_size", document.file_size},
                     {"word_count", document.word_count},
                     {"character_count", document.character_count},
                     {"content_hash", document.content_hash},
                     {"upload_time", time_point_to_string(document.upload_time)}};
}

DocumentStore::DocumentStore() : rng_(std::random_device{}()) {}

// Random (version 4) UUID in canonical 8-4-4-4-12 form
std::string DocumentStore::generate_doc_id() {
  std::uniform_int_distribution<uint64_t> dist;
  uint64_t high = dist(rng_);
  uint64_t low = dist(rng_);
  high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  char buffer[37];
  std::snprintf(buffer, sizeof(buffer), "%08x-%04x-%04x-%04x-%012llx",
                static_cast<unsigned>(high >> 32), static_cast<unsigned>((high >> 16) & 0xFFFF),
                static_cast<unsigned>(high & 0xFFFF), static_cast<unsigned>(low >> 48),
                static_cast<unsigned long long>(low & 0xFFFFFFFFFFFFULL));
  return buffer;
}

AddDocumentResult DocumentStore::add(const std::string &filename,
                                     FileType file_type,
                                     const std::string &text) {
  if (text_utils::trim(text).empty()) {
    throw DocumentStoreError("No text content in document: " + filename);
  }

  std::string content_hash;
  try {
    content_hash = hash_utils::sha256_hex(text);
  } catch (const std::runtime_error &e) {
    throw DocumentStoreError("Failed to hash document " + filename + ": " + e.what());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &[doc_id, document] : documents_) {
    if (document.content_hash == content_hash) {
      std::cout << "[DocumentStore] Duplicate file detected: " << filename << std::endl;
      return {document, true};
    }
  }

  Document document;
  do {
    document.doc_id = generate_doc_id();
  } while (documents_.count(document.doc_id) > 0);
  document.filename = filename;
  document.file_type = file_type;
  document.content_hash = content_hash;
  document.text = text;
  document.file_size = text.size();
  document.word_count = text_utils::split_whitespace(text).size();
  document.character_count = text_utils::count_code_points(text);
  document.upload_time = std::chrono::system_clock::now();

  documents_[document.doc_id] = document;
  order_.push_back(document.doc_id);
  std::cout << "[DocumentStore] Stored " << filename << " as " << document.doc_id << " ("
            << document.word_count << " words)" << std::endl;
  return {document, false};
}

std::optional<Document> DocumentStore::get(const std::string &doc_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = documents_.find(doc_id);
  if (it == documents_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Document> DocumentStore::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Document> documents;
  documents.reserve(order_.size());
  for (auto it = order_.rbegin(); it != order_.rend(); ++it) {
    documents.push_back(documents_.at(*it));
  }
  return documents;
}

bool DocumentStore::remove(const std::string &doc_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = documents_.find(doc_id);
  if (it == documents_.end()) {
    return false;
  }
  std::cout << "[DocumentStore] Deleted document: " << it->second.filename << std::endl;
  documents_.erase(it);
  order_.erase(std::remove(order_.begin(), order_.end(), doc_id), order_.end());
  return true;
}

size_t DocumentStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return documents_.size();
}

}  // namespace docqa_core
