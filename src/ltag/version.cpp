/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   version information
*/

#include "ltag/common_pch.h"

#include "ltag/version.h"

std::string
get_version_info(std::string const &program,
                 version_info_flags_e flags) {
  auto info = program.empty() ? fmt::format("v{0}", LTAG_VERSION) : fmt::format("{0} v{1}", program, LTAG_VERSION);

  if (flags & vif_architecture)
    info += fmt::format(" {0}-bit", sizeof(void *) * 8);

  return info;
}
