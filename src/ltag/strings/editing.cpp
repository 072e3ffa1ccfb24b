/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   string helper functions
*/

#include "ltag/common_pch.h"

#include "ltag/strings/editing.h"

namespace ltag::string {

namespace {

char const *
whitespace(bool newlines) {
  return newlines ? " \t\r\n" : " \t";
}

}

std::vector<std::string>
split(std::string const &text,
      std::string const &separator,
      std::size_t max) {
  if (separator.empty() || (max <= 1))
    return { text };

  std::vector<std::string> parts;
  std::size_t start = 0;

  while (parts.size() < (max - 1)) {
    auto pos = text.find(separator, start);
    if (pos == std::string::npos)
      break;

    parts.emplace_back(text.substr(start, pos - start));
    start = pos + separator.size();
  }

  parts.emplace_back(text.substr(start));

  return parts;
}

void
strip_back(std::string &s,
           bool newlines) {
  auto last = s.find_last_not_of(whitespace(newlines));
  s.erase(last == std::string::npos ? 0 : last + 1);
}

void
strip(std::string &s,
      bool newlines) {
  strip_back(s, newlines);
  s.erase(0, s.find_first_not_of(whitespace(newlines)));
}

std::string
strip_copy(std::string const &s,
           bool newlines) {
  auto copy = s;
  strip(copy, newlines);
  return copy;
}

} // ltag::string
