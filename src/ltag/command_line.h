/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   command line helper functions
*/

#pragma once

#include "ltag/common_pch.h"

namespace ltag::cli {

extern std::string g_usage_text;
extern bool g_abort_on_warnings;

std::vector<std::string> args_in_utf8(int argc, char **argv);
void read_args_from_json_file(std::vector<std::string> &args, std::string const &file_name);
void handle_common_args(std::vector<std::string> &args);

[[noreturn]]
void display_usage(int exit_code = 0);

}
