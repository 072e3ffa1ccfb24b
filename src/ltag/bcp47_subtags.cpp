/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   BCP 47 language tags: character classes and subtag segmentation
*/

#include "ltag/common_pch.h"

#include "ltag/bcp47_subtags.h"

namespace ltag::bcp47::subtags {

bool
is_alphabetic(std::string_view const &s)
  noexcept {
  return std::all_of(s.begin(), s.end(), is_alpha);
}

bool
is_numeric(std::string_view const &s)
  noexcept {
  return std::all_of(s.begin(), s.end(), is_digit);
}

bool
is_alphanumeric(std::string_view const &s)
  noexcept {
  return std::all_of(s.begin(), s.end(), is_alnum);
}

bool
is_alphanumeric_or_dash(std::string_view const &s)
  noexcept {
  return std::all_of(s.begin(), s.end(), [](char c) { return is_alnum(c) || (c == '-'); });
}

splitter_c::splitter_c(std::string_view input)
  : m_input{input}
{
}

std::optional<subtag_t>
splitter_c::next() {
  if (m_done)
    return {};

  auto dash = m_input.find('-', m_position);

  if (dash == std::string_view::npos) {
    m_done = true;
    return subtag_t{ m_input.substr(m_position), m_input.size() };
  }

  auto subtag = subtag_t{ m_input.substr(m_position, dash - m_position), dash };
  m_position  = dash + 1;

  return subtag;
}

std::vector<std::string>
split_list(std::string_view const &list) {
  std::vector<std::string> result;
  splitter_c splitter{list};

  while (auto subtag = splitter.next()) {
    if (subtag->text.empty())
      break;
    result.emplace_back(subtag->text);
  }

  return result;
}

} // namespace ltag::bcp47::subtags
