/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   definitions shared by the library, the tool and the tests
*/

#pragma once

#include "ltag/os.h"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/system/error_code.hpp>

namespace balg = boost::algorithm;

using namespace std::string_literals;

// Translatable strings. Y() marks a message, FY() a message used as a
// format string.
#if defined(HAVE_LIBINTL_H)
# include <libintl.h>
# undef fprintf
# undef snprintf
# undef sprintf
#else
# define gettext(s) (s)
#endif

#undef Y
#undef FY
#define Y(s)  gettext(s)
#define FY(s) fmt::runtime(gettext(s))

[[noreturn]]
void mxexit(int code = -1);

extern unsigned int verbose;

void ltag_common_init(std::string const &program_name, char const *argv0);
std::string const &get_program_name();

#include "ltag/debugging.h"
#include "ltag/error.h"
#include "ltag/output.h"
