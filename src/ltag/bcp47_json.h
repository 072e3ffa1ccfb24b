/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   BCP 47 language tags: conversion from and to JSON
*/

#pragma once

#include "ltag/common_pch.h"

#include "ltag/bcp47.h"
#include "ltag/json.h"

namespace nlohmann {

// A tag is stored as its serialization. Reading a string that is not a
// well-formed tag throws std::domain_error.
template<>
struct adl_serializer<ltag::bcp47::language_tag_c> {
  static ltag::bcp47::language_tag_c from_json(json const &j);
  static void to_json(json &j, ltag::bcp47::language_tag_c const &tag);
};

} // namespace nlohmann
