// note_test.cpp - keyword header parsing and the identifier index

#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "core/note.hpp"
#include "core/note_index.hpp"

static const char *kNote = "#+title:      Publishing \"notes\"\n"
                           "#+date:       [2024-01-04 Thu 09:15]\n"
                           "#+filetags:   :emacs:org-mode:\n"
                           "#+identifier: 20240104T091500\n"
                           "#+aliases:    pub publishing\n"
                           "#+category:   howto\n"
                           "#+HUGO_SECTION: posts\n"
                           "\n"
                           "* First heading\n"
                           "Body text.\n";

TEST(NoteParserTest, ReadsKeywordHeader) {
  NoteDocument note = NoteParser::parse(kNote);

  EXPECT_EQ(note.metadata.title, "Publishing \"notes\"");
  EXPECT_EQ(note.identifier, "20240104T091500");
  EXPECT_EQ(note.metadata.tags, (std::vector<std::string>{"emacs", "org-mode"}));
  ASSERT_TRUE(note.metadata.aliases.has_value());
  EXPECT_EQ(*note.metadata.aliases, "pub publishing");
  ASSERT_TRUE(note.metadata.category.has_value());
  EXPECT_EQ(*note.metadata.category, "howto");
  EXPECT_TRUE(note.warnings.empty());

  ASSERT_TRUE(note.metadata.created.has_value());
  EXPECT_EQ(note.metadata.created->tm_year, 124);
  EXPECT_EQ(note.metadata.created->tm_mon, 0);
  EXPECT_EQ(note.metadata.created->tm_mday, 4);
}

TEST(NoteParserTest, BodyStartsAfterHeader) {
  NoteDocument note = NoteParser::parse(kNote);
  EXPECT_EQ(note.body, "* First heading\nBody text.\n");
}

TEST(NoteParserTest, UnknownKeywordsBecomeOptions) {
  NoteDocument note = NoteParser::parse(kNote);

  MetaValue section = note.metadata.option("hugo_section");
  EXPECT_EQ(section.type, MetaValue::STRING);
  EXPECT_EQ(section.text, "posts");
  EXPECT_EQ(note.metadata.option("HUGO-SECTION").text, "posts");
  EXPECT_TRUE(note.metadata.option("title").is_absent());
}

TEST(NoteParserTest, NoCategoryKeywordMeansNoCategory) {
  NoteDocument note =
      NoteParser::parse("#+title: x\n", "notes/20240101T000000--x__journal.org");
  EXPECT_FALSE(note.metadata.category.has_value());
}

TEST(NoteParserTest, IdentifierAndDateFromFileName) {
  NoteDocument note = NoteParser::parse(
      "#+title: From the name\n\ntext\n",
      "notes/20231130T221500--from-the-name__misc.org");

  EXPECT_EQ(note.identifier, "20231130T221500");
  ASSERT_TRUE(note.metadata.created.has_value());
  EXPECT_EQ(note.metadata.created->tm_year, 123);
  EXPECT_EQ(note.metadata.created->tm_mon, 10);
  EXPECT_EQ(note.metadata.created->tm_mday, 30);
  EXPECT_TRUE(note.metadata.tags.empty());
}

TEST(NoteParserTest, BadDateWarnsAndFallsBackToIdentifier) {
  NoteDocument note = NoteParser::parse(
      "#+date: sometime soon\n#+identifier: 20240301T080000\n");

  ASSERT_EQ(note.warnings.size(), 1u);
  EXPECT_NE(note.warnings[0].find("sometime soon"), std::string::npos);
  ASSERT_TRUE(note.metadata.created.has_value());
  EXPECT_EQ(note.metadata.created->tm_mon, 2);
  EXPECT_EQ(note.metadata.created->tm_mday, 1);
}

TEST(NoteParserTest, ContentWithoutHeaderIsAllBody) {
  NoteDocument note = NoteParser::parse("Just text\n#+title: late\n");

  EXPECT_EQ(note.body, "Just text\n#+title: late\n");
  EXPECT_TRUE(note.metadata.title.empty());
  EXPECT_FALSE(note.metadata.created.has_value());
}

TEST(NoteParserTest, SourceBlockEndsHeader) {
  NoteDocument note =
      NoteParser::parse("#+title: Code\n#+begin_src sh\necho hi\n#+end_src\n");

  EXPECT_EQ(note.metadata.title, "Code");
  EXPECT_EQ(note.body, "#+begin_src sh\necho hi\n#+end_src\n");
}

TEST(NoteParserTest, ParseDateFormats) {
  auto iso = NoteParser::parse_date("2024-02-29");
  ASSERT_TRUE(iso.has_value());
  EXPECT_EQ(iso->tm_mday, 29);

  auto slashed = NoteParser::parse_date("2024/02/28");
  ASSERT_TRUE(slashed.has_value());
  EXPECT_EQ(slashed->tm_mday, 28);

  auto org = NoteParser::parse_date("<2024-02-27 Tue>");
  ASSERT_TRUE(org.has_value());
  EXPECT_EQ(org->tm_mday, 27);

  EXPECT_FALSE(NoteParser::parse_date("yesterday").has_value());
}

TEST(NoteParserTest, IdentifierFromFileName) {
  EXPECT_EQ(NoteParser::identifier_from_filename(
                "20240101T120000--title__tag.org"),
            "20240101T120000");
  EXPECT_EQ(NoteParser::identifier_from_filename("20240101T120000.org"),
            "20240101T120000");
  EXPECT_EQ(NoteParser::identifier_from_filename("readme.org"), "");
}

TEST(NoteParserTest, NormalizeKey) {
  EXPECT_EQ(NoteParser::normalize_key("HUGO_SECTION"), "hugo-section");
  EXPECT_EQ(NoteParser::normalize_key(":export-file-name"), "export-file-name");
  EXPECT_EQ(NoteParser::normalize_key("Title"), "title");
}

TEST(NoteParserTest, SplitTags) {
  EXPECT_EQ(NoteParser::split_tags(":a:b::c:"),
            (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_TRUE(NoteParser::split_tags("::").empty());
}

TEST(NoteIndexTest, DuplicateIdentifiersAreRejected) {
  NoteIndex index;
  EXPECT_TRUE(index.add("20240101T120000", "a.org"));
  EXPECT_FALSE(index.add("20240101T120000", "b.org"));
  EXPECT_EQ(index.size(), 1u);
}

TEST(NoteIndexTest, ResolveSplitsQuery) {
  NoteIndex index;
  index.add("20240101T120000", "a.org");

  ResolvedReference ref = index.resolve("20240101T120000::heading");
  EXPECT_EQ(ref.identifier, "20240101T120000");
  ASSERT_TRUE(ref.query.has_value());
  EXPECT_EQ(*ref.query, "heading");

  EXPECT_THROW(index.resolve("19990101T000000"), ReferenceResolutionError);
}
