/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   string helper functions
*/

#pragma once

#include "ltag/common_pch.h"

#include <limits>

namespace ltag::string {

// Splits at every occurrence of \c separator, keeping empty parts. With
// \c max given the last part contains the unsplit remainder.
std::vector<std::string> split(std::string const &text, std::string const &separator = ",", std::size_t max = std::numeric_limits<std::size_t>::max());

// Removes blanks and tabs (and newlines if requested) from both ends or
// from the end only.
void strip(std::string &s, bool newlines = false);
std::string strip_copy(std::string const &s, bool newlines = false);
void strip_back(std::string &s, bool newlines = false);

} // ltag::string
