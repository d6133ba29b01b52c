#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>

#include "common/utilities_test.hpp"
#include "docqa_core/extractors/content_extractor_factory.hpp"
#include "docqa_core/extractors/markdown_extractor.hpp"
#include "docqa_core/extractors/plaintext_extractor.hpp"

namespace docqa_tests {

using docqa_core::ContentExtractorError;
using docqa_core::FileType;

class ContentExtractorFactoryTest : public TempDirTestBase {
 protected:
  void SetUp() override {
    TempDirTestBase::SetUp();
    factory_ = std::make_unique<docqa_core::ContentExtractorFactory>();
  }

  std::unique_ptr<docqa_core::ContentExtractorFactory> factory_;
};

// Test factory for markdown files
TEST_F(ContentExtractorFactoryTest, GetExtractor_MarkdownFiles) {
  for (const std::string filename : {"README.md", "notes.md"}) {
    const auto& extractor = factory_->get_extractor_for(temp_dir_ / filename);

    EXPECT_NE(dynamic_cast<const docqa_core::MarkdownExtractor*>(&extractor), nullptr)
        << "Should be MarkdownExtractor for " << filename;
    EXPECT_EQ(extractor.get_file_type(), FileType::Markdown);
  }
}

// Test factory for text files
TEST_F(ContentExtractorFactoryTest, GetExtractor_TextFiles) {
  const auto& extractor = factory_->get_extractor_for(temp_dir_ / "minutes.txt");

  EXPECT_NE(dynamic_cast<const docqa_core::PlainTextExtractor*>(&extractor), nullptr);
  EXPECT_EQ(extractor.get_file_type(), FileType::Text);
}

TEST_F(ContentExtractorFactoryTest, GetExtractor_UnsupportedFilesThrow) {
  for (const std::string filename : {"report.pdf", "image.png", "no_extension", "data.TXT"}) {
    EXPECT_THROW(factory_->get_extractor_for(temp_dir_ / filename), ContentExtractorError)
        << filename;
    EXPECT_FALSE(factory_->is_supported(temp_dir_ / filename)) << filename;
  }
  EXPECT_TRUE(factory_->is_supported("notes.md"));
  EXPECT_TRUE(factory_->is_supported("notes.txt"));
}

TEST_F(ContentExtractorFactoryTest, ExtractText_ReturnsFileContents) {
  // Arrange
  const std::string markdown = "# Title\n\nSome *emphasis* and a [link](http://example.com).\n";
  auto md_path = write_file("guide.md", markdown);
  auto txt_path = write_file("plain.txt", "caf\xC3\xA9 menu\n");

  // Act & Assert: markdown is returned as raw source
  EXPECT_EQ(factory_->get_extractor_for(md_path).extract_text(md_path), markdown);
  EXPECT_EQ(factory_->get_extractor_for(txt_path).extract_text(txt_path), "caf\xC3\xA9 menu\n");
}

TEST_F(ContentExtractorFactoryTest, ExtractText_MissingFileThrows) {
  auto path = temp_dir_ / "missing.txt";
  EXPECT_THROW(factory_->get_extractor_for(path).extract_text(path), ContentExtractorError);
}

TEST_F(ContentExtractorFactoryTest, ExtractText_InvalidUtf8Throws) {
  auto path = write_file("binary.txt", std::string("ok \xFF\xFE\x00 bytes", 12));
  EXPECT_THROW(factory_->get_extractor_for(path).extract_text(path), ContentExtractorError);
}

}  // namespace docqa_tests
