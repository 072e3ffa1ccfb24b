/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   string formatting functions
*/

#include "ltag/common_pch.h"

#include <iterator>

#include "ltag/strings/formatting.h"

namespace ltag::string {

namespace {

template<typename ConverterT>
std::string
convert_chars(std::string_view const &src,
              ConverterT converter) {
  std::string dst(src.size(), '\0');
  std::transform(src.begin(), src.end(), dst.begin(), converter);
  return dst;
}

template<typename ConverterT>
std::vector<std::string>
convert_all(std::vector<std::string> const &src,
            ConverterT converter) {
  std::vector<std::string> dst;
  dst.reserve(src.size());
  std::transform(src.begin(), src.end(), std::back_inserter(dst), converter);
  return dst;
}

}

std::string
to_lower_ascii(std::string_view const &src) {
  return convert_chars(src, [](char c) { return to_lower_ascii(c); });
}

std::string
to_upper_ascii(std::string_view const &src) {
  return convert_chars(src, [](char c) { return to_upper_ascii(c); });
}

std::vector<std::string>
to_lower_ascii(std::vector<std::string> const &src) {
  return convert_all(src, [](std::string const &s) { return to_lower_ascii(std::string_view{s}); });
}

std::vector<std::string>
to_upper_ascii(std::vector<std::string> const &src) {
  return convert_all(src, [](std::string const &s) { return to_upper_ascii(std::string_view{s}); });
}

} // ltag::string
