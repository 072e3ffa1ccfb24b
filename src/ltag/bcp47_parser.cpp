/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   BCP 47 language tags: the parser
*/

#include "ltag/common_pch.h"

#include "ltag/bcp47.h"
#include "ltag/bcp47_subtags.h"
#include "ltag/iana_language_subtag_registry.h"
#include "ltag/strings/formatting.h"

namespace ltag::bcp47 {

namespace {

enum class state_e {
  start,
  after_language,
  after_extlang,
  after_script,
  after_region,
  in_extension,
  in_private_use,
};

enum class case_e {
  lower,
  upper,
  title,
};

// Script, region and variant subtags may only follow these states.
bool
may_precede_script(state_e state) {
  return (state == state_e::after_language) || (state == state_e::after_extlang);
}

bool
may_precede_region(state_e state) {
  return may_precede_script(state) || (state == state_e::after_script);
}

bool
may_precede_variant(state_e state) {
  return may_precede_region(state) || (state == state_e::after_region);
}

void
append_subtag(std::string &serialization,
              std::string_view const &subtag,
              case_e mode) {
  if (!serialization.empty())
    serialization += '-';

  for (auto idx = 0u; idx < subtag.size(); ++idx) {
    auto upper = (mode == case_e::upper) || ((mode == case_e::title) && (idx == 0));
    serialization += upper ? ltag::string::to_upper_ascii(subtag[idx]) : ltag::string::to_lower_ascii(subtag[idx]);
  }
}

} // anonymous namespace

language_tag_c
language_tag_c::from_single_component(std::string serialization) {
  auto end = serialization.size();
  return { std::move(serialization), end, end, end, end, end, end };
}

parse_result_c
language_tag_c::parse(std::string const &text) {
  auto grandfathered = ltag::iana::language_subtag_registry::look_up_grandfathered(text);
  if (grandfathered)
    return from_single_component(grandfathered->code);

  if (!subtags::is_alphanumeric_or_dash(text))
    return parse_error_e::forbidden_char;

  if ((text.size() >= 2) && ((text[0] == 'x') || (text[0] == 'X')) && (text[1] == '-'))
    return parse_private_use_only(text);

  return parse_regular(text);
}

parse_result_c
language_tag_c::parse_private_use_only(std::string const &text) {
  if (text.size() == 2)
    return parse_error_e::empty_private_use;

  subtags::splitter_c splitter{std::string_view{text}.substr(2)};

  while (auto subtag = splitter.next()) {
    if (subtag->text.empty())
      return parse_error_e::empty_subtag;

    if (subtag->text.size() > subtags::max_length)
      return parse_error_e::subtag_too_long;
  }

  return from_single_component(ltag::string::to_lower_ascii(text));
}

parse_result_c
language_tag_c::parse_regular(std::string const &text) {
  std::string serialization;
  serialization.reserve(text.size());

  auto state          = state_e::start;
  auto value_expected = false;
  auto num_extlangs   = 0u;

  std::size_t language_end{}, extlang_end{}, script_end{}, region_end{}, variant_end{}, extension_end{};

  subtags::splitter_c splitter{text};

  while (auto subtag = splitter.next()) {
    auto [str, end] = *subtag;
    auto length     = str.size();

    if (str.empty())
      return parse_error_e::empty_subtag;

    if (length > subtags::max_length)
      return parse_error_e::subtag_too_long;

    if (state == state_e::start) {
      if ((length < 2) || !subtags::is_alphabetic(str))
        return parse_error_e::invalid_language;

      append_subtag(serialization, str, case_e::lower);
      language_end = end;
      state        = length < 4 ? state_e::after_language : state_e::after_extlang;

    } else if (state == state_e::in_private_use) {
      if (!subtags::is_alphanumeric(str))
        return parse_error_e::invalid_subtag;

      append_subtag(serialization, str, case_e::lower);
      value_expected = false;

    } else if ((length == 1) && subtags::is_alnum(str[0])) {
      // "x" starts the private use section, everything else an extension
      if ((state == state_e::in_extension) && value_expected)
        return parse_error_e::empty_extension;

      append_subtag(serialization, str, case_e::lower);
      state          = ltag::string::to_lower_ascii(str[0]) == 'x' ? state_e::in_private_use : state_e::in_extension;
      value_expected = true;

    } else if (state == state_e::in_extension) {
      if (!subtags::is_alphanumeric(str))
        return parse_error_e::invalid_subtag;

      append_subtag(serialization, str, case_e::lower);
      extension_end  = end;
      value_expected = false;

    } else if ((state == state_e::after_language) && (length == 3) && subtags::is_alphabetic(str)) {
      if (++num_extlangs > 3)
        return parse_error_e::too_many_extlangs;

      append_subtag(serialization, str, case_e::lower);
      extlang_end = end;

    } else if (   may_precede_script(state)
               && (length == 4)
               && subtags::is_alphabetic(str)) {
      append_subtag(serialization, str, case_e::title);
      script_end = end;
      state      = state_e::after_script;

    } else if (   may_precede_region(state)
               && (   ((length == 2) && subtags::is_alphabetic(str))
                   || ((length == 3) && subtags::is_numeric(str)))) {
      append_subtag(serialization, str, case_e::upper);
      region_end = end;
      state      = state_e::after_region;

    } else if (   may_precede_variant(state)
               && subtags::is_alphanumeric(str)
               && (   ((length >= 5) && subtags::is_alpha(str[0]))
                   || ((length >= 4) && subtags::is_digit(str[0])))) {
      append_subtag(serialization, str, case_e::lower);
      variant_end = end;
      state       = state_e::after_region;

    } else
      return parse_error_e::invalid_subtag;
  }

  if ((state == state_e::in_extension) && value_expected)
    return parse_error_e::empty_extension;

  if ((state == state_e::in_private_use) && value_expected)
    return parse_error_e::empty_private_use;

  // absent components end where their predecessor ends
  extlang_end   = std::max(extlang_end,   language_end);
  script_end    = std::max(script_end,    extlang_end);
  region_end    = std::max(region_end,    script_end);
  variant_end   = std::max(variant_end,   region_end);
  extension_end = std::max(extension_end, variant_end);

  return language_tag_c{ std::move(serialization), language_end, extlang_end, script_end, region_end, variant_end, extension_end };
}

} // namespace ltag::bcp47
