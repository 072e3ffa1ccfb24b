/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   BCP 47 language tags
*/

#include "ltag/common_pch.h"

#include <fmt/ranges.h>

#include "ltag/bcp47.h"
#include "ltag/bcp47_subtags.h"
#include "ltag/iana_language_subtag_registry.h"
#include "ltag/strings/formatting.h"

namespace ltag::bcp47 {

namespace registry = ltag::iana::language_subtag_registry;

std::string
to_string(parse_error_e error) {
  switch (error) {
    case parse_error_e::empty_subtag:      return Y("A subtag should not be empty.");
    case parse_error_e::subtag_too_long:   return Y("A subtag may be eight characters in length at maximum.");
    case parse_error_e::invalid_language:  return Y("The given language subtag is invalid.");
    case parse_error_e::invalid_subtag:    return Y("A subtag fails to parse, it does not match any other subtags.");
    case parse_error_e::too_many_extlangs: return Y("At maximum three extended language subtags are allowed.");
    case parse_error_e::empty_extension:   return Y("If an extension subtag is present, it must not be empty.");
    case parse_error_e::empty_private_use: return Y("If the 'x' subtag is present, it must not be empty.");
    case parse_error_e::forbidden_char:    return Y("The language tag contains a character that is not allowed.");
  }

  return Y("Unknown parser error.");
}

std::string
to_string(validation_error_e error) {
  switch (error) {
    case validation_error_e::duplicate_variant:                  return Y("The same variant subtag is only allowed once in a tag.");
    case validation_error_e::duplicate_extension:                return Y("The same extension subtag is only allowed once in a tag.");
    case validation_error_e::multiple_extended_language_subtags: return Y("Only one extended language subtag is allowed.");
  }

  return Y("Unknown validation error.");
}

// ------------------------------------------------------------

std::string
language_tag_c::extension_t::format()
  const {
  if (values.empty())
    return std::string(1, identifier);
  return fmt::format("{0}-{1}", identifier, ltag::string::join(values, "-"));
}

bool
language_tag_c::extension_t::operator ==(extension_t const &other)
  const noexcept {
  return (identifier == other.identifier)
      && (values     == other.values);
}

bool
language_tag_c::extension_t::operator !=(extension_t const &other)
  const noexcept {
  return !(*this == other);
}

// ------------------------------------------------------------

language_tag_c::language_tag_c(std::string serialization,
                               std::size_t language_end,
                               std::size_t extlang_end,
                               std::size_t script_end,
                               std::size_t region_end,
                               std::size_t variant_end,
                               std::size_t extension_end)
  : m_serialization{std::move(serialization)}
  , m_language_end{language_end}
  , m_extlang_end{extlang_end}
  , m_script_end{script_end}
  , m_region_end{region_end}
  , m_variant_end{variant_end}
  , m_extension_end{extension_end}
{
}

std::string const &
language_tag_c::format()
  const noexcept {
  return m_serialization;
}

std::string const &
language_tag_c::as_text()
  const noexcept {
  return m_serialization;
}

std::string
language_tag_c::release() && {
  return std::move(m_serialization);
}

std::string
language_tag_c::dump()
  const {
  return fmt::format("[serialization {0} language {1} extended_language_subtags {2} script {3} region {4} variants {5} extensions {6} private_use {7} grandfathered {8} "
                     "ends {9}/{10}/{11}/{12}/{13}/{14}]",
                     m_serialization, get_primary_language(), get_extended_language_subtags(), get_script(), get_region(), get_variant_subtags(), get_extension(), get_private_use_subtags(), is_grandfathered(),
                     m_language_end, m_extlang_end, m_script_end, m_region_end, m_variant_end, m_extension_end);
}

std::string_view
language_tag_c::slice(std::size_t start,
                      std::size_t end)
  const {
  return std::string_view{m_serialization}.substr(start, end - start);
}

std::string_view
language_tag_c::component(std::size_t previous_end,
                          std::size_t end)
  const {
  if (previous_end == end)
    return {};

  // skip the dash separating the component from its predecessor
  return slice(previous_end + 1, end);
}

std::string
language_tag_c::get_primary_language()
  const {
  return std::string{slice(0, m_language_end)};
}

std::string
language_tag_c::get_extended_language()
  const {
  return std::string{component(m_language_end, m_extlang_end)};
}

std::vector<std::string>
language_tag_c::get_extended_language_subtags()
  const {
  return subtags::split_list(component(m_language_end, m_extlang_end));
}

std::string
language_tag_c::get_full_language()
  const {
  return std::string{slice(0, m_extlang_end)};
}

std::string
language_tag_c::get_script()
  const {
  return std::string{component(m_extlang_end, m_script_end)};
}

std::string
language_tag_c::get_region()
  const {
  return std::string{component(m_script_end, m_region_end)};
}

std::string
language_tag_c::get_variant()
  const {
  return std::string{component(m_region_end, m_variant_end)};
}

std::vector<std::string>
language_tag_c::get_variant_subtags()
  const {
  return subtags::split_list(component(m_region_end, m_variant_end));
}

std::string
language_tag_c::get_extension()
  const {
  return std::string{component(m_variant_end, m_extension_end)};
}

std::vector<language_tag_c::extension_t>
language_tag_c::get_extensions()
  const {
  std::vector<extension_t> extensions;

  for (auto const &subtag : subtags::split_list(component(m_variant_end, m_extension_end))) {
    if (subtag.size() == 1)
      extensions.push_back({ subtag[0], {} });

    else if (!extensions.empty())
      extensions.back().values.emplace_back(subtag);
  }

  return extensions;
}

std::string
language_tag_c::get_private_use()
  const {
  if (is_private_use_only())
    return m_serialization;

  if (m_extension_end == m_serialization.size())
    return {};

  return std::string{slice(m_extension_end + 1, m_serialization.size())};
}

std::vector<std::string>
language_tag_c::get_private_use_subtags()
  const {
  auto private_use = get_private_use();

  if (private_use.size() < 2)
    return {};

  // everything after the leading "x-"
  return subtags::split_list(std::string_view{private_use}.substr(2));
}

bool
language_tag_c::is_grandfathered()
  const noexcept {
  if (m_language_end != m_serialization.size())
    return false;

  return std::find_if(registry::g_grandfathered.begin(), registry::g_grandfathered.end(), [this](auto const &entry) {
    return entry.code == m_serialization;
  }) != registry::g_grandfathered.end();
}

bool
language_tag_c::is_private_use_only()
  const noexcept {
  return (m_serialization.size() >= 2)
      && (m_serialization[0] == 'x')
      && (m_serialization[1] == '-');
}

bool
language_tag_c::is_language_range()
  const noexcept {
  return (m_variant_end   == m_extension_end)
      && (m_extension_end == m_serialization.size())
      && !is_private_use_only();
}

std::optional<validation_error_e>
language_tag_c::validate()
  const {
  auto variants = get_variant_subtags();

  for (auto current = variants.begin(), end = variants.end(); current != end; ++current)
    if (std::find(current + 1, end, *current) != end)
      return validation_error_e::duplicate_variant;

  std::bitset<36> seen_singletons;

  for (auto const &extension : get_extensions()) {
    auto identifier = extension.identifier;
    auto idx        = subtags::is_digit(identifier) ? identifier - '0' : identifier - 'a' + 10;

    if (seen_singletons.test(idx))
      return validation_error_e::duplicate_extension;

    seen_singletons.set(idx);
  }

  if (get_extended_language().find('-') != std::string::npos)
    return validation_error_e::multiple_extended_language_subtags;

  return {};
}

bool
language_tag_c::is_valid()
  const {
  return !validate();
}

language_tag_c
language_tag_c::canonicalize()
  const {
  if (is_private_use_only())
    return *this;

  auto language      = get_primary_language();
  auto grandfathered = registry::look_up_grandfathered(language);

  if (grandfathered && grandfathered->preferred_value) {
    auto result = parse_regular(*grandfathered->preferred_value);
    if (!result)
      throw ltag::invalid_parameter_x{fmt::format("the preferred value '{0}' of the grandfathered tag '{1}' is not well-formed: {2}", *grandfathered->preferred_value, grandfathered->code, result.get_error())};

    return result.get();
  }

  auto extlangs = get_extended_language_subtags();
  if (!extlangs.empty()) {
    language = extlangs.front();
    extlangs.erase(extlangs.begin());
  }

  if (auto deprecated = registry::look_up_deprecated_language(language); deprecated)
    language = deprecated->preferred_value;

  std::string serialization;
  serialization.reserve(m_serialization.size());

  auto append = [&serialization](std::string const &subtag) {
    if (!serialization.empty())
      serialization += '-';
    serialization += subtag;
  };

  append(language);
  auto language_end = serialization.size();

  for (auto const &extlang : extlangs)
    append(extlang);
  auto extlang_end = serialization.size();

  auto script = get_script();
  if (!script.empty())
    append(script);
  auto script_end = serialization.size();

  auto region = get_region();
  if (auto deprecated = registry::look_up_deprecated_region(region); deprecated)
    region = deprecated->preferred_value;
  if (!region.empty())
    append(region);
  auto region_end = serialization.size();

  for (auto const &variant : get_variant_subtags())
    append(variant == "heploc"s ? "alalc97"s : variant);
  auto variant_end = serialization.size();

  auto extension = get_extension();
  if (!extension.empty())
    append(extension);
  auto extension_end = serialization.size();

  auto private_use = get_private_use();
  if (!private_use.empty())
    append(private_use);

  return { std::move(serialization), language_end, extlang_end, script_end, region_end, variant_end, extension_end };
}

bool
language_tag_c::matches(language_tag_c const &tag)
  const {
  if (!is_language_range())
    throw ltag::invalid_parameter_x{fmt::format("'{0}' is not a language range", m_serialization)};

  if (get_full_language() != tag.get_full_language())
    return false;

  auto script = get_script();
  if (!script.empty() && (script != tag.get_script()))
    return false;

  auto region = get_region();
  if (!region.empty() && (region != tag.get_region()))
    return false;

  auto range_variants = get_variant_subtags();
  auto tag_variants   = tag.get_variant_subtags();

  for (std::size_t idx = 0, num_variants = std::min(range_variants.size(), tag_variants.size()); idx < num_variants; ++idx)
    if (range_variants[idx] != tag_variants[idx])
      return false;

  return true;
}

bool
language_tag_c::operator ==(language_tag_c const &other)
  const noexcept {
  return m_serialization == other.m_serialization;
}

bool
language_tag_c::operator !=(language_tag_c const &other)
  const noexcept {
  return !(*this == other);
}

// ------------------------------------------------------------

parse_result_c::parse_result_c(language_tag_c tag)
  : m_tag{std::move(tag)}
{
}

parse_result_c::parse_result_c(parse_error_e error)
  : m_error{error}
{
}

bool
parse_result_c::is_ok()
  const noexcept {
  return m_tag.has_value();
}

parse_result_c::operator bool()
  const noexcept {
  return is_ok();
}

language_tag_c const &
parse_result_c::get()
  const {
  if (!m_tag)
    throw ltag::invalid_parameter_x{fmt::format("the parse result holds the error '{0}' instead of a language tag", *m_error)};
  return *m_tag;
}

language_tag_c const &
parse_result_c::operator *()
  const {
  return get();
}

language_tag_c const *
parse_result_c::operator ->()
  const {
  return &get();
}

parse_error_e
parse_result_c::get_error()
  const {
  if (!m_error)
    throw ltag::invalid_parameter_x{fmt::format("the parse result holds the language tag '{0}' instead of an error", *m_tag)};
  return *m_error;
}

} // namespace ltag::bcp47
