#include "ltag/common_pch.h"

#include "ltag/bcp47_subtags.h"

#include "tests/unit/init.h"

namespace {

using namespace ltag::bcp47::subtags;

TEST(BCP47Subtags, CharacterClasses) {
  EXPECT_TRUE(is_alphabetic("abcXYZ"));
  EXPECT_FALSE(is_alphabetic("abc1"));
  EXPECT_TRUE(is_numeric("0419"));
  EXPECT_FALSE(is_numeric("04a"));
  EXPECT_TRUE(is_alphanumeric("1606nict"));
  EXPECT_FALSE(is_alphanumeric("de-AT"));
  EXPECT_TRUE(is_alphanumeric_or_dash("de-AT-1901"));
  EXPECT_FALSE(is_alphanumeric_or_dash("de_AT"));
  EXPECT_FALSE(is_alphanumeric_or_dash("d\xc3\xa4"));
}

TEST(BCP47Subtags, CharacterClassesOfEmptyStrings) {
  EXPECT_TRUE(is_alphabetic(""));
  EXPECT_TRUE(is_numeric(""));
  EXPECT_TRUE(is_alphanumeric(""));
  EXPECT_TRUE(is_alphanumeric_or_dash(""));
}

TEST(BCP47Subtags, Splitting) {
  splitter_c splitter{"de-Latn-AT"};

  auto subtag = splitter.next();
  ASSERT_TRUE(subtag.has_value());
  EXPECT_EQ("de",   subtag->text);
  EXPECT_EQ(2u,     subtag->end);

  subtag = splitter.next();
  ASSERT_TRUE(subtag.has_value());
  EXPECT_EQ("Latn", subtag->text);
  EXPECT_EQ(7u,     subtag->end);

  subtag = splitter.next();
  ASSERT_TRUE(subtag.has_value());
  EXPECT_EQ("AT",   subtag->text);
  EXPECT_EQ(10u,    subtag->end);

  EXPECT_FALSE(splitter.next().has_value());
  EXPECT_FALSE(splitter.next().has_value());
}

TEST(BCP47Subtags, SplittingYieldsEmptySubtags) {
  std::vector<std::string> subtags;
  std::vector<std::size_t> ends;
  splitter_c splitter{"-en--GB-"};

  while (auto subtag = splitter.next()) {
    subtags.emplace_back(subtag->text);
    ends.push_back(subtag->end);
  }

  EXPECT_EQ((std::vector<std::string>{ "", "en", "", "GB", "" }), subtags);
  EXPECT_EQ((std::vector<std::size_t>{ 0, 3, 4, 7, 8 }),          ends);
}

TEST(BCP47Subtags, SplittingEmptyInput) {
  splitter_c splitter{""};

  auto subtag = splitter.next();
  ASSERT_TRUE(subtag.has_value());
  EXPECT_TRUE(subtag->text.empty());
  EXPECT_EQ(0u, subtag->end);
  EXPECT_FALSE(splitter.next().has_value());
}

TEST(BCP47Subtags, SplittingLists) {
  EXPECT_EQ((std::vector<std::string>{ "1606nict", "rozaj" }), split_list("1606nict-rozaj"));
  EXPECT_EQ((std::vector<std::string>{ "yue" }),               split_list("yue"));
  EXPECT_TRUE(split_list("").empty());
}

}
