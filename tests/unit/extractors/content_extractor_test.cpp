#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>

#include "ragdex_core/extractors/content_extractor_factory.hpp"
#include "ragdex_core/extractors/pdf_extractor.hpp"
#include "ragdex_core/extractors/plaintext_extractor.hpp"
#include "../../common/utilities_test.hpp"

namespace ragdex_core {

using ragdex_tests::TestUtilities;

class ContentExtractorTest : public ragdex_tests::TempDirectoryTestBase {
 protected:
  ContentExtractorFactory factory_;
};

TEST_F(ContentExtractorTest, FactoryOrdersPlainTextBeforePdf) {
  const auto& extractors = factory_.extractors();

  ASSERT_EQ(extractors.size(), 2u);
  EXPECT_EQ(extractors[0]->get_file_type(), DocumentType::Text);
  EXPECT_EQ(extractors[1]->get_file_type(), DocumentType::PDF);
}

TEST_F(ContentExtractorTest, EachFileTypeHasOneExtractor) {
  const auto& extractors = factory_.extractors();

  EXPECT_TRUE(extractors[0]->can_handle(temp_dir_ / "notes.txt"));
  EXPECT_FALSE(extractors[1]->can_handle(temp_dir_ / "notes.txt"));
  EXPECT_TRUE(extractors[1]->can_handle(temp_dir_ / "paper.pdf"));
  EXPECT_FALSE(extractors[0]->can_handle(temp_dir_ / "paper.pdf"));
}

TEST_F(ContentExtractorTest, UnsupportedFilesHaveNoExtractor) {
  for (const auto* name : {"README.md", "image.png", "no_extension"}) {
    for (const auto& extractor : factory_.extractors()) {
      EXPECT_FALSE(extractor->can_handle(temp_dir_ / name)) << name;
    }
  }
}

TEST_F(ContentExtractorTest, ExtensionMatchIsCaseSensitive) {
  PlainTextExtractor plaintext;
  PdfExtractor pdf;

  EXPECT_TRUE(plaintext.can_handle("a.txt"));
  EXPECT_FALSE(plaintext.can_handle("a.TXT"));
  EXPECT_TRUE(pdf.can_handle("a.pdf"));
  EXPECT_FALSE(pdf.can_handle("a.txt"));
}

TEST_F(ContentExtractorTest, PlainTextReturnsFileContents) {
  auto path = TestUtilities::write_file(temp_dir_ / "doc.txt", "Apples are red.\nSecond line.\n");
  PlainTextExtractor extractor;

  EXPECT_EQ(extractor.extract_text(path), "Apples are red.\nSecond line.\n");
}

TEST_F(ContentExtractorTest, PlainTextEmptyFileGivesEmptyText) {
  auto path = TestUtilities::write_file(temp_dir_ / "empty.txt", "");
  PlainTextExtractor extractor;

  EXPECT_EQ(extractor.extract_text(path), "");
}

TEST_F(ContentExtractorTest, PlainTextMissingFileThrows) {
  PlainTextExtractor extractor;

  EXPECT_THROW(extractor.extract_text(temp_dir_ / "missing.txt"), ContentExtractorError);
}

TEST_F(ContentExtractorTest, PdfGarbageFileThrows) {
  auto path = TestUtilities::write_file(temp_dir_ / "broken.pdf", "this is not a pdf");
  PdfExtractor extractor;

  EXPECT_THROW(extractor.extract_text(path), ContentExtractorError);
}

TEST_F(ContentExtractorTest, SanitizeKeepsValidUtf8) {
  std::string text = "caf\xC3\xA9 na\xC3\xAFve";

  EXPECT_EQ(ContentExtractor::sanitize_utf8(text), text);
}

TEST_F(ContentExtractorTest, SanitizeReplacesInvalidBytes) {
  std::string text = "ok\xFF" "end";

  std::string cleaned = ContentExtractor::sanitize_utf8(text);

  EXPECT_EQ(cleaned, "ok\xEF\xBF\xBD" "end");
}

TEST(DocumentTypeTest, NamesAreLowercase) {
  EXPECT_EQ(to_string(DocumentType::Html), "html");
  EXPECT_EQ(to_string(DocumentType::Text), "text");
  EXPECT_EQ(to_string(DocumentType::PDF), "pdf");
  EXPECT_EQ(to_string(DocumentType::Unknown), "unknown");
}

}  // namespace ragdex_core
