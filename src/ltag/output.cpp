/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   console output: informational messages, warnings and errors
*/

#include "ltag/common_pch.h"

#include <chrono>
#include <iostream>

#include <fmt/chrono.h>

#include "ltag/command_line.h"
#include "ltag/debugging.h"
#include "ltag/json.h"
#include "ltag/output.h"

bool g_suppress_info     = false;
bool g_suppress_warnings = false;
bool g_warning_issued    = false;

namespace {

std::ostream *s_stdio        = &std::cout;
bool s_stdio_redirected      = false;

std::map<unsigned int, mxmsg_handler_t> s_handlers;

struct json_messages_t {
  std::vector<std::string> warnings, errors;
} s_json_messages;

void
call_handler(unsigned int level,
             std::string const &message) {
  auto itr = s_handlers.find(level);
  if ((itr != s_handlers.end()) && itr->second)
    itr->second(level, message);
}

std::string
timestamp_prefix() {
  static debugging_option_c s_timestamped_messages{"timestamped_messages"};

  if (!s_timestamped_messages)
    return {};

  return fmt::format("{0:%Y-%m-%d %H:%M:%S} ", fmt::localtime(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now())));
}

void
print_info(unsigned int,
           std::string const &info) {
  mxmsg(MXMSG_INFO, info);
}

void
print_warning(unsigned int,
              std::string const &warning) {
  if (g_suppress_warnings)
    return;

  mxmsg(MXMSG_WARNING, warning);
  g_warning_issued = true;

  if (ltag::cli::g_abort_on_warnings)
    mxexit(1);
}

void
print_error(unsigned int,
            std::string const &error) {
  mxmsg(MXMSG_ERROR, error);
  mxexit(2);
}

void
collect_for_json(unsigned int level,
                 std::string const &message) {
  auto stripped = balg::trim_right_copy(message);

  if (MXMSG_WARNING == level) {
    s_json_messages.warnings.push_back(stripped);
    g_warning_issued = true;

    if (!ltag::cli::g_abort_on_warnings)
      return;

    display_json_output(nlohmann::json::object());
    mxexit(1);
  }

  s_json_messages.errors.push_back(stripped);
  display_json_output(nlohmann::json::object());
  mxexit(2);
}

}

void
set_mxmsg_handler(unsigned int level,
                  mxmsg_handler_t const &handler) {
  if ((MXMSG_INFO != level) && (MXMSG_WARNING != level) && (MXMSG_ERROR != level))
    throw ltag::invalid_parameter_x{fmt::format("unknown message level {0}", level)};

  s_handlers[level] = handler;
}

void
init_common_output() {
  set_mxmsg_handler(MXMSG_INFO,    print_info);
  set_mxmsg_handler(MXMSG_WARNING, print_warning);
  set_mxmsg_handler(MXMSG_ERROR,   print_error);
}

void
redirect_stdio(std::ostream &new_stdio) {
  s_stdio            = &new_stdio;
  s_stdio_redirected = true;
}

bool
stdio_redirected() {
  return s_stdio_redirected;
}

void
redirect_warnings_and_errors_to_json() {
  set_mxmsg_handler(MXMSG_WARNING, collect_for_json);
  set_mxmsg_handler(MXMSG_ERROR,   collect_for_json);
}

void
display_json_output(nlohmann::json json) {
  json["warnings"] = s_json_messages.warnings;
  json["errors"]   = s_json_messages.errors;

  mxinfo(fmt::format("{0}\n", ltag::json::dump(json, 2)));
}

/** \brief Print a message of the given level

   Warnings and errors are prefixed with "Warning:" and "Error:". A
   leading newline is output before the prefix.
*/
void
mxmsg(unsigned int level,
      std::string message) {
  if ((MXMSG_INFO == level) && g_suppress_info)
    return;

  auto &out = *s_stdio;

  if (balg::starts_with(message, "\n")) {
    out << "\n";
    message.erase(0, 1);
  }

  auto prefix = timestamp_prefix();

  if (MXMSG_ERROR == level) {
    std::string label{Y("Error:")};
    if (balg::starts_with(message, label))
      balg::trim_left(message.erase(0, label.size()));
    out << fmt::format("{0}{1} ", prefix, label);

  } else if (MXMSG_WARNING == level)
    out << fmt::format("{0}{1} ", prefix, Y("Warning:"));

  else
    out << prefix;

  out << message;
  out.flush();
}

void
mxinfo(std::string const &info) {
  call_handler(MXMSG_INFO, info);
}

void
mxwarn(std::string const &warning) {
  call_handler(MXMSG_WARNING, warning);
}

void
mxerror(std::string const &error) {
  call_handler(MXMSG_ERROR, error);
}
