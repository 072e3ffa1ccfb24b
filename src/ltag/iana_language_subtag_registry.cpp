/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   IANA language subtag registry: grandfathered tags and deprecated codes
*/

#include "ltag/common_pch.h"

#include "ltag/iana_language_subtag_registry.h"

namespace ltag::iana::language_subtag_registry {

std::optional<grandfathered_entry_t>
look_up_grandfathered(std::string_view const &s) {
  if (s.empty())
    return {};

  auto itr = std::find_if(g_grandfathered.begin(), g_grandfathered.end(), [&s](auto const &entry) {
    return balg::iequals(s, entry.code);
  });

  if (itr != g_grandfathered.end())
    return *itr;

  return {};
}

namespace {

std::optional<deprecated_entry_t>
look_up_deprecated(std::string_view const &s,
                   std::vector<deprecated_entry_t> const &entries) {
  if (s.empty())
    return {};

  auto itr = std::find_if(entries.begin(), entries.end(), [&s](auto const &entry) {
    return s == entry.code;
  });

  if (itr != entries.end())
    return *itr;

  return {};
}

}

std::optional<deprecated_entry_t>
look_up_deprecated_language(std::string_view const &s) {
  return look_up_deprecated(s, g_deprecated_languages);
}

std::optional<deprecated_entry_t>
look_up_deprecated_region(std::string_view const &s) {
  return look_up_deprecated(s, g_deprecated_regions);
}

} // namespace ltag::iana::language_subtag_registry
