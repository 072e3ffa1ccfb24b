/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   console output: informational messages, warnings and errors
*/

#pragma once

#include "ltag/os.h"

#include <functional>
#include <ostream>

#include "ltag/json.h"

constexpr auto MXMSG_ERROR   =  5;
constexpr auto MXMSG_WARNING = 10;
constexpr auto MXMSG_INFO    = 15;

// A handler receives every message of one level. The default handlers
// print to the output stream; mxerror's default handler exits with code 2.
using mxmsg_handler_t = std::function<void(unsigned int level, std::string const &message)>;
void set_mxmsg_handler(unsigned int level, mxmsg_handler_t const &handler);
void init_common_output();

extern bool g_suppress_info, g_suppress_warnings, g_warning_issued;

void redirect_stdio(std::ostream &new_stdio);
bool stdio_redirected();

// Collects warnings and errors instead of printing them. They are output
// together with the program's own JSON document by display_json_output().
void redirect_warnings_and_errors_to_json();
void display_json_output(nlohmann::json json);

void mxmsg(unsigned int level, std::string message);

void mxinfo(std::string const &info);
void mxwarn(std::string const &warning);
void mxerror(std::string const &error);
