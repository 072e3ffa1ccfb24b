/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   IANA language subtag registry: grandfathered tags and deprecated codes
*/

#pragma once

#include "ltag/common_pch.h"

namespace ltag::iana::language_subtag_registry {

struct grandfathered_entry_t {
  std::string code;
  std::optional<std::string> preferred_value;
  bool is_irregular;
  std::string description;
};

struct deprecated_entry_t {
  std::string code, preferred_value;
};

extern std::vector<grandfathered_entry_t> const g_grandfathered;
extern std::vector<deprecated_entry_t> const g_deprecated_languages, g_deprecated_regions;

std::optional<grandfathered_entry_t> look_up_grandfathered(std::string_view const &s);
std::optional<deprecated_entry_t> look_up_deprecated_language(std::string_view const &s);
std::optional<deprecated_entry_t> look_up_deprecated_region(std::string_view const &s);

} // namespace ltag::iana::language_subtag_registry
