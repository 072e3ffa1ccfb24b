/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   string formatting functions
*/

#pragma once

#include "ltag/common_pch.h"

#include <string_view>

#include <fmt/ranges.h>

namespace ltag::string {

template<typename RangeT, typename SeparatorT>
std::string
join(RangeT const &range,
     SeparatorT const &separator) {
  return fmt::format("{}", fmt::join(range, separator));
}

template<typename IteratorT, typename SeparatorT>
std::string
join(IteratorT first,
     IteratorT last,
     SeparatorT const &separator) {
  return fmt::format("{}", fmt::join(first, last, separator));
}

constexpr char
to_lower_ascii(char c) {
  return (c >= 'A') && (c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
}

constexpr char
to_upper_ascii(char c) {
  return (c >= 'a') && (c <= 'z') ? static_cast<char>(c - ('a' - 'A')) : c;
}

std::string to_lower_ascii(std::string_view const &src);
std::string to_upper_ascii(std::string_view const &src);

std::vector<std::string> to_lower_ascii(std::vector<std::string> const &src);
std::vector<std::string> to_upper_ascii(std::vector<std::string> const &src);

} // ltag::string
