#include "ltag/common_pch.h"

#include "ltag/bcp47.h"
#include "ltag/iana_language_subtag_registry.h"

#include "tests/unit/init.h"

namespace {

using namespace ltag::iana::language_subtag_registry;

TEST(IANALanguageSubtagRegistry, TableSizes) {
  EXPECT_EQ(26u, g_grandfathered.size());
  EXPECT_EQ(53u, g_deprecated_languages.size());
  EXPECT_EQ(6u,  g_deprecated_regions.size());
}

TEST(IANALanguageSubtagRegistry, LookingUpGrandfathered) {
  auto entry = look_up_grandfathered("i-klingon");

  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ("i-klingon"s, entry->code);
  EXPECT_EQ("tlh"s,       entry->preferred_value.value());
  EXPECT_TRUE(entry->is_irregular);
  EXPECT_EQ("Klingon"s,   entry->description);

  entry = look_up_grandfathered("EN-gb-OED");
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ("en-GB-oed"s, entry->code);

  entry = look_up_grandfathered("zh-min");
  ASSERT_TRUE(entry.has_value());
  EXPECT_FALSE(entry->preferred_value.has_value());
  EXPECT_FALSE(entry->is_irregular);

  EXPECT_FALSE(look_up_grandfathered("").has_value());
  EXPECT_FALSE(look_up_grandfathered("en-GB").has_value());
  EXPECT_FALSE(look_up_grandfathered("i-klingon-x").has_value());
}

TEST(IANALanguageSubtagRegistry, LookingUpDeprecated) {
  EXPECT_EQ("he"s,  look_up_deprecated_language("iw").value().preferred_value);
  EXPECT_EQ("ktz"s, look_up_deprecated_language("aue").value().preferred_value);
  EXPECT_EQ("MM"s,  look_up_deprecated_region("BU").value().preferred_value);
  EXPECT_EQ("CD"s,  look_up_deprecated_region("ZR").value().preferred_value);

  EXPECT_FALSE(look_up_deprecated_language("en").has_value());
  EXPECT_FALSE(look_up_deprecated_language("").has_value());
  EXPECT_FALSE(look_up_deprecated_region("DE").has_value());
}

TEST(IANALanguageSubtagRegistry, LookingUpDeprecatedIsCaseSensitive) {
  EXPECT_FALSE(look_up_deprecated_language("IW").has_value());
  EXPECT_FALSE(look_up_deprecated_region("bu").has_value());
}

TEST(IANALanguageSubtagRegistry, GrandfatheredTagsAreRecognizedByTheParser) {
  for (auto const &entry : g_grandfathered) {
    auto result = ltag::bcp47::language_tag_c::parse(entry.code);

    ASSERT_TRUE(result.is_ok()) << entry.code;
    EXPECT_EQ(entry.code, result->format());
    EXPECT_TRUE(result->is_grandfathered()) << entry.code;
  }
}

TEST(IANALanguageSubtagRegistry, PreferredValuesAreWellFormed) {
  for (auto const &entry : g_grandfathered) {
    if (!entry.preferred_value)
      continue;

    auto result = ltag::bcp47::language_tag_c::parse(*entry.preferred_value);
    ASSERT_TRUE(result.is_ok()) << *entry.preferred_value;
    EXPECT_EQ(*entry.preferred_value, result->format());
    EXPECT_EQ(result.get(), ltag::bcp47::language_tag_c::parse(entry.code)->canonicalize());
  }

  for (auto const &entries : { std::cref(g_deprecated_languages), std::cref(g_deprecated_regions) })
    for (auto const &entry : entries.get())
      EXPECT_FALSE(entry.preferred_value.empty()) << entry.code;
}

}
