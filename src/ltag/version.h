/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   version information
*/

#pragma once

#include "ltag/common_pch.h"

enum version_info_flags_e {
  vif_none         = 0x0000,
  vif_architecture = 0x0001,

  vif_default      = vif_architecture,
  vif_full         = vif_architecture,
};

// "<program> v<version> [<bits>-bit]"; the program name is left out when empty.
std::string get_version_info(std::string const &program, version_info_flags_e flags = vif_default);
