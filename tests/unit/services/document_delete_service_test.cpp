#include <gtest/gtest.h>

#include "common/mocks_test.hpp"
#include "docqa_core/services/document_delete_service.hpp"
#include "docqa_core/vector/faiss_vector_store.hpp"

namespace docqa_tests {

using docqa_core::FileType;

class DocumentDeleteServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    document_store_ = std::make_shared<docqa_core::DocumentStore>();
    keyword_index_ = std::make_shared<docqa_core::KeywordIndex>();
    vector_store_ = std::make_shared<docqa_core::FaissVectorStore>(4);
    service_ = std::make_unique<docqa_core::DocumentDeleteService>(document_store_,
                                                                   keyword_index_, vector_store_);

    kept_id_ = index_document("kept.txt", {"kept chunk one", "kept chunk two"});
    deleted_id_ = index_document("deleted.txt", {"deleted chunk"});
  }

  std::string index_document(const std::string& filename, const std::vector<std::string>& texts) {
    std::string joined;
    for (const auto& text : texts) {
      joined += text + ". ";
    }
    auto doc_id = document_store_->add(filename, FileType::Text, joined).document.doc_id;
    auto chunks = MockUtilities::create_test_chunks(doc_id, texts, filename);
    keyword_index_->add(chunks);
    vector_store_->upsert(
        chunks, std::vector<std::vector<float>>(chunks.size(), MockUtilities::create_test_embedding()));
    return doc_id;
  }

  std::shared_ptr<docqa_core::DocumentStore> document_store_;
  std::shared_ptr<docqa_core::KeywordIndex> keyword_index_;
  std::shared_ptr<docqa_core::FaissVectorStore> vector_store_;
  std::unique_ptr<docqa_core::DocumentDeleteService> service_;
  std::string kept_id_;
  std::string deleted_id_;
};

TEST_F(DocumentDeleteServiceTest, Constructor_RejectsNullCollaborators) {
  using docqa_core::DocumentDeleteService;
  EXPECT_THROW(DocumentDeleteService(nullptr, keyword_index_, vector_store_), std::invalid_argument);
  EXPECT_THROW(DocumentDeleteService(document_store_, nullptr, vector_store_), std::invalid_argument);
  EXPECT_THROW(DocumentDeleteService(document_store_, keyword_index_, nullptr), std::invalid_argument);
}

TEST_F(DocumentDeleteServiceTest, DeleteDocument_RemovesFromStoreAndIndexes) {
  EXPECT_TRUE(service_->delete_document(deleted_id_));

  EXPECT_FALSE(document_store_->get(deleted_id_).has_value());
  EXPECT_EQ(keyword_index_->size(), 2u);
  EXPECT_EQ(vector_store_->size(), 2u);

  for (const auto& result : keyword_index_->search("deleted chunk", 10)) {
    EXPECT_EQ(result.doc_id, kept_id_);
  }
  for (const auto& result : vector_store_->query(MockUtilities::create_test_embedding(), 10)) {
    EXPECT_EQ(result.doc_id, kept_id_);
  }
}

TEST_F(DocumentDeleteServiceTest, DeleteDocument_UnknownIdReturnsFalse) {
  EXPECT_FALSE(service_->delete_document("no-such-document"));
  EXPECT_EQ(document_store_->size(), 2u);
  EXPECT_EQ(keyword_index_->size(), 3u);
  EXPECT_EQ(vector_store_->size(), 3u);
}

TEST_F(DocumentDeleteServiceTest, DeleteDocument_SecondDeleteReturnsFalse) {
  EXPECT_TRUE(service_->delete_document(kept_id_));
  EXPECT_FALSE(service_->delete_document(kept_id_));
  EXPECT_EQ(keyword_index_->document_count(), 1u);
}

}  // namespace docqa_tests
