#include "docqa_core/services/document_delete_service.hpp"

#include <stdexcept>

namespace docqa_core {

DocumentDeleteService::DocumentDeleteService(std::shared_ptr<DocumentStore> document_store,
                                             std::shared_ptr<KeywordIndex> keyword_index,
                                             std::shared_ptr<VectorStore> vector_store)
    : document_store_(document_store), keyword_index_(keyword_index), vector_store_(vector_store) {
  if (!document_store_ || !keyword_index_ || !vector_store_) {
    throw std::invalid_argument("DocumentDeleteService requires a document store, keyword index "
                                "and vector store");
  }
}

bool DocumentDeleteService::delete_document(const std::string &doc_id) {
  const bool removed = document_store_->remove(doc_id);
  // Both indexes are cleaned even if the store had no record
  vector_store_->remove_document(doc_id);
  keyword_index_->remove(doc_id);
  return removed;
}

}  // namespace docqa_core
