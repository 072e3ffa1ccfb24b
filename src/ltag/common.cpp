/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   program initialization and termination
*/

#include "ltag/common_pch.h"

#include <clocale>
#include <cstdlib>

#include "ltag/logger.h"

unsigned int verbose = 1;

static std::string s_program_name;

/** \brief Terminate the program

   Exits with \c code if one is given. Otherwise the exit code is 1 if a
   warning has been issued and 0 if not.
*/
void
mxexit(int code) {
  std::cout.flush();
  std::cerr.flush();

  if (code == -1)
    code = g_warning_issued ? 1 : 0;

  std::exit(code);
}

void
ltag_common_init(std::string const &program_name,
                 char const *) {
  s_program_name = program_name;

  ::setlocale(LC_MESSAGES, "");
#if defined(HAVE_LIBINTL_H)
  bindtextdomain(LTAG_TEXT_DOMAIN, LTAG_LOCALE_DIR);
  textdomain(LTAG_TEXT_DOMAIN);
#endif

  debugging_c::init();
  ltag::log::init();

  init_common_output();
}

std::string const &
get_program_name() {
  return s_program_name;
}
