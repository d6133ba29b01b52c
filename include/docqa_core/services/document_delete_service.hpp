#pragma once

#include <memory>
#include <string>

#include "docqa_core/index/keyword_index.hpp"
#include "docqa_core/store/document_store.hpp"
#include "docqa_core/vector/vector_store.hpp"

namespace docqa_core {

class DocumentDeleteService {
 public:
  DocumentDeleteService(std::shared_ptr<DocumentStore> document_store,
                        std::shared_ptr<KeywordIndex> keyword_index,
                        std::shared_ptr<VectorStore> vector_store);

  // Removes the document and its chunks from both indexes. Returns false if the document
  // was not stored.
  bool delete_document(const std::string &doc_id);

 private:
  std::shared_ptr<DocumentStore> document_store_;
  std::shared_ptr<KeywordIndex> keyword_index_;
  std::shared_ptr<VectorStore> vector_store_;
};

}  // namespace docqa_core
