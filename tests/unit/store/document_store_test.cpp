#include <gtest/gtest.h>

#include <regex>

#include "docqa_core/store/document_store.hpp"

namespace docqa_tests {

using docqa_core::DocumentStore;
using docqa_core::DocumentStoreError;
using docqa_core::FileType;

class DocumentStoreTest : public ::testing::Test {
 protected:
  DocumentStore store_;
};

TEST_F(DocumentStoreTest, Add_StoresDocumentWithMetadata) {
  auto result = store_.add("notes.txt", FileType::Text, "abc");

  EXPECT_FALSE(result.duplicate);
  const auto& doc = result.document;
  static const std::regex uuid_regex(
      "^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
  EXPECT_TRUE(std::regex_match(doc.doc_id, uuid_regex)) << doc.doc_id;
  EXPECT_EQ(doc.filename, "notes.txt");
  EXPECT_EQ(doc.file_type, FileType::Text);
  EXPECT_EQ(doc.content_hash, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(doc.file_size, 3u);
  EXPECT_EQ(store_.size(), 1u);
}

TEST_F(DocumentStoreTest, Add_CountsWordsAndCodePoints) {
  auto doc = store_.add("menu.md", FileType::Markdown, "caf\xC3\xA9 au  lait\n").document;

  EXPECT_EQ(doc.word_count, 3u);
  EXPECT_EQ(doc.character_count, 14u);
  EXPECT_EQ(doc.file_size, 15u);
}

TEST_F(DocumentStoreTest, Add_DuplicateContentReturnsExistingDocument) {
  auto first = store_.add("a.txt", FileType::Text, "same content");
  auto second = store_.add("b.txt", FileType::Text, "same content");

  EXPECT_TRUE(second.duplicate);
  EXPECT_EQ(second.document.doc_id, first.document.doc_id);
  EXPECT_EQ(second.document.filename, "a.txt");
  EXPECT_EQ(store_.size(), 1u);
}

TEST_F(DocumentStoreTest, Add_BlankTextThrows) {
  EXPECT_THROW(store_.add("empty.txt", FileType::Text, ""), DocumentStoreError);
  EXPECT_THROW(store_.add("blank.txt", FileType::Text, " \n\t "), DocumentStoreError);
  EXPECT_EQ(store_.size(), 0u);
}

TEST_F(DocumentStoreTest, GetAndRemove) {
  auto doc_id = store_.add("a.txt", FileType::Text, "alpha").document.doc_id;

  auto fetched = store_.get(doc_id);
  ASSERT_TRUE(fetched.has_value());
  EXPECT_EQ(fetched->text, "alpha");
  EXPECT_FALSE(store_.get("unknown").has_value());

  EXPECT_TRUE(store_.remove(doc_id));
  EXPECT_FALSE(store_.remove(doc_id));
  EXPECT_FALSE(store_.get(doc_id).has_value());
  EXPECT_EQ(store_.size(), 0u);
}

TEST_F(DocumentStoreTest, List_NewestFirst) {
  store_.add("first.txt", FileType::Text, "one");
  auto second = store_.add("second.txt", FileType::Text, "two").document.doc_id;
  store_.add("third.txt", FileType::Text, "three");

  auto documents = store_.list();
  ASSERT_EQ(documents.size(), 3u);
  EXPECT_EQ(documents[0].filename, "third.txt");
  EXPECT_EQ(documents[1].filename, "second.txt");
  EXPECT_EQ(documents[2].filename, "first.txt");

  store_.remove(second);
  documents = store_.list();
  ASSERT_EQ(documents.size(), 2u);
  EXPECT_EQ(documents[1].filename, "first.txt");
}

TEST_F(DocumentStoreTest, ToJson_OmitsText) {
  auto doc = store_.add("a.md", FileType::Markdown, "body text").document;

  nlohmann::json j = doc;
  EXPECT_EQ(j["id"], doc.doc_id);
  EXPECT_EQ(j["file_type"], "md");
  EXPECT_EQ(j["word_count"], 2);
  EXPECT_FALSE(j.contains("text"));
  EXPECT_EQ(j["upload_time"].get<std::string>().back(), 'Z');
}

}  // namespace docqa_tests
