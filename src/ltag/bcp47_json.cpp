/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   BCP 47 language tags: conversion from and to JSON
*/

#include "ltag/common_pch.h"

#include <stdexcept>

#include "ltag/bcp47_json.h"

namespace nlohmann {

ltag::bcp47::language_tag_c
adl_serializer<ltag::bcp47::language_tag_c>::from_json(json const &j) {
  if (!j.is_string())
    throw std::domain_error{fmt::format(FY("A language tag must be stored as a JSON string, not as '{0}'."), ltag::json::dump(j))};

  auto text   = j.get<std::string>();
  auto result = ltag::bcp47::language_tag_c::parse(text);

  if (!result)
    throw std::domain_error{fmt::format(FY("The language tag '{0}' is not well-formed: {1}"), text, result.get_error())};

  return result.get();
}

void
adl_serializer<ltag::bcp47::language_tag_c>::to_json(json &j,
                                                     ltag::bcp47::language_tag_c const &tag) {
  j = tag.format();
}

} // namespace nlohmann
