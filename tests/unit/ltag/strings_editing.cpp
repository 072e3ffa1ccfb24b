#include "ltag/common_pch.h"

#include "ltag/strings/editing.h"

#include "tests/unit/init.h"

namespace {

TEST(StringsEditing, SplittingEmptyPattern) {
  auto r = ltag::string::split("en,de,fr"s, ""s);

  ASSERT_EQ(1u,          r.size());
  EXPECT_EQ("en,de,fr"s, r[0]);
}

TEST(StringsEditing, SplittingEmptyText) {
  auto r = ltag::string::split(""s, ","s);

  ASSERT_EQ(1u,  r.size());
  EXPECT_EQ(""s, r[0]);
}

TEST(StringsEditing, SplittingOneCharPattern) {
  auto r = ltag::string::split("timestamped_messages,to_logger|ltagtool"s, ","s);

  ASSERT_EQ(2u,                       r.size());
  EXPECT_EQ("timestamped_messages"s,  r[0]);
  EXPECT_EQ("to_logger|ltagtool"s,    r[1]);
}

TEST(StringsEditing, SplittingTwoCharsPattern) {
  auto r = ltag::string::split("en, de, fr"s, ", "s);

  ASSERT_EQ(3u,    r.size());
  EXPECT_EQ("en"s, r[0]);
  EXPECT_EQ("de"s, r[1]);
  EXPECT_EQ("fr"s, r[2]);
}

TEST(StringsEditing, SplittingWithLimit) {
  auto r = ltag::string::split("option=value=more"s, "="s, 2);

  ASSERT_EQ(2u,             r.size());
  EXPECT_EQ("option"s,      r[0]);
  EXPECT_EQ("value=more"s,  r[1]);

  r = ltag::string::split("option=value=more"s, "="s, 1);

  ASSERT_EQ(1u,                    r.size());
  EXPECT_EQ("option=value=more"s,  r[0]);
}

TEST(StringsEditing, SplittingPatternAtStartAndEnd) {
  auto r = ltag::string::split(",en,"s, ","s);

  ASSERT_EQ(3u,    r.size());
  EXPECT_EQ(""s,   r[0]);
  EXPECT_EQ("en"s, r[1]);
  EXPECT_EQ(""s,   r[2]);
}

TEST(StringsEditing, Stripping) {
  EXPECT_EQ("en-GB"s,         ltag::string::strip_copy(" \ten-GB\t "s));
  EXPECT_EQ("en-GB\n"s,       ltag::string::strip_copy("  en-GB\n"s));
  EXPECT_EQ("en-GB"s,         ltag::string::strip_copy("\n en-GB \r\n"s, true));
  EXPECT_EQ(""s,              ltag::string::strip_copy(" \t "s));

  auto s = "  de-AT  "s;
  ltag::string::strip_back(s);
  EXPECT_EQ("  de-AT"s, s);

  ltag::string::strip(s);
  EXPECT_EQ("de-AT"s, s);
}

}
