#include "ltag/common_pch.h"

#include <stdexcept>

#include "ltag/bcp47_json.h"

#include "tests/unit/init.h"

namespace {

using namespace ltag::bcp47;

TEST(BCP47JSON, Encoding) {
  auto tag  = language_tag_c::parse("sr-latn-rs").get();
  auto json = nlohmann::json(tag);

  ASSERT_TRUE(json.is_string());
  EXPECT_EQ("sr-Latn-RS"s,   json.get<std::string>());
  EXPECT_EQ("\"sr-Latn-RS\""s, ltag::json::dump(json));
}

TEST(BCP47JSON, EncodingInsideDocuments) {
  auto doc = nlohmann::json{
    { "tags", std::vector<language_tag_c>{ language_tag_c::parse("de").get(), language_tag_c::parse("i-klingon").get() } },
  };

  EXPECT_EQ("{\"tags\":[\"de\",\"i-klingon\"]}"s, doc.dump());
}

TEST(BCP47JSON, Decoding) {
  auto doc = ltag::json::parse("{ \"tag\": \"EN-gb\" } // trailing comment");

  EXPECT_EQ("en-GB"s, doc["tag"].get<language_tag_c>().format());
  EXPECT_EQ("GB"s,    doc["tag"].get<language_tag_c>().get_region());
}

TEST(BCP47JSON, DecodingInvalidTags) {
  EXPECT_THROW(nlohmann::json("en--GB").get<language_tag_c>(), std::domain_error);
  EXPECT_THROW(nlohmann::json("x-").get<language_tag_c>(),     std::domain_error);
  EXPECT_THROW(nlohmann::json(42).get<language_tag_c>(),       std::domain_error);
}

TEST(BCP47JSON, DecodingInvalidTagsReportsTheReason) {
  try {
    nlohmann::json("en_GB").get<language_tag_c>();
    FAIL() << "no exception thrown";

  } catch (std::domain_error const &ex) {
    EXPECT_NE(std::string::npos, std::string{ex.what()}.find(to_string(parse_error_e::forbidden_char)));
  }
}

}
