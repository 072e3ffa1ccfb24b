/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   BCP 47 language tags: character classes and subtag segmentation
*/

#pragma once

#include "ltag/common_pch.h"

#include <string_view>

namespace ltag::bcp47::subtags {

constexpr std::size_t max_length = 8;

constexpr bool is_alpha(char c) noexcept { return ((c >= 'a') && (c <= 'z')) || ((c >= 'A') && (c <= 'Z')); }
constexpr bool is_digit(char c) noexcept { return (c >= '0') && (c <= '9'); }
constexpr bool is_alnum(char c) noexcept { return is_alpha(c) || is_digit(c); }

// All four are true for an empty string.
bool is_alphabetic(std::string_view const &s) noexcept;
bool is_numeric(std::string_view const &s) noexcept;
bool is_alphanumeric(std::string_view const &s) noexcept;
bool is_alphanumeric_or_dash(std::string_view const &s) noexcept;

struct subtag_t {
  std::string_view text;
  std::size_t end{};            // offset one past the subtag's last character
};

/** \brief Splits a tag into its dash separated subtags

   Yields every subtag including empty ones (leading, trailing or
   doubled dashes) together with the offset of its end. The offsets are
   valid for the normalized output as well because normalization never
   changes a subtag's length.
*/
class splitter_c {
private:
  std::string_view m_input;
  std::size_t m_position{};
  bool m_done{};

public:
  explicit splitter_c(std::string_view input);

  std::optional<subtag_t> next();
};

std::vector<std::string> split_list(std::string_view const &list);

} // namespace ltag::bcp47::subtags
