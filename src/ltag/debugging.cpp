/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   debug options requested on the command line or via the environment
*/

#include "ltag/common_pch.h"

#include <cstdlib>

#include "ltag/debugging.h"
#include "ltag/logger.h"
#include "ltag/strings/editing.h"

bool debugging_c::ms_send_to_logger = false;
std::map<std::string, std::string> debugging_c::ms_options;

std::vector<debugging_option_c::cached_option_t> debugging_option_c::ms_cache;

void
debugging_c::init() {
  for (auto const &variable : { "LTAG_DEBUG"s, balg::to_upper_copy(get_program_name()) + "_DEBUG" }) {
    auto value = std::getenv(variable.c_str());
    if (value && *value)
      request(value);
  }

#if defined(SYS_WINDOWS)
  send_to_logger(true);
#endif
}

void
debugging_c::request(std::string const &options,
                     bool enable) {
  for (auto const &option : ltag::string::split(options)) {
    auto name_and_arg = ltag::string::split(option, "=", 2);
    auto const &name  = name_and_arg[0];

    if (name.empty())
      continue;

    if (name == "!")
      ms_options.clear();

    else if (name == "to_logger")
      send_to_logger(enable);

    else if (enable)
      ms_options[name] = name_and_arg.size() > 1 ? name_and_arg[1] : ""s;

    else
      ms_options.erase(name);
  }

  debugging_option_c::invalidate_cache();
}

/** \brief Whether or not a debug option has been requested

   \param alternatives One or more option names separated by '|'. The
     first one that has been requested wins.
   \param arg If given it receives the option's argument.
*/
bool
debugging_c::requested(std::string const &alternatives,
                       std::string *arg) {
  for (auto const &name : ltag::string::split(alternatives, "|")) {
    auto itr = ms_options.find(name);
    if (itr == ms_options.end())
      continue;

    if (arg)
      *arg = itr->second;

    return true;
  }

  return false;
}

void
debugging_c::send_to_logger(bool enable) {
  ms_send_to_logger = enable;
}

void
debugging_c::output(std::string const &message) {
  if (ms_send_to_logger)
    log_it(message);
  else
    mxmsg(MXMSG_INFO, message);
}

// ------------------------------------------------------------

debugging_option_c::operator bool()
  const {
  auto &option = cached();

  if (!option.requested)
    option.requested = debugging_c::requested(option.name);

  return *option.requested;
}

void
debugging_option_c::set(std::optional<bool> requested) {
  cached().requested = requested;
}

debugging_option_c::cached_option_t &
debugging_option_c::cached()
  const {
  if (!m_cache_idx)
    m_cache_idx = register_option(m_name);

  return ms_cache.at(*m_cache_idx);
}

std::size_t
debugging_option_c::register_option(std::string const &name) {
  auto itr = std::find_if(ms_cache.begin(), ms_cache.end(), [&name](auto const &option) { return option.name == name; });

  if (itr != ms_cache.end())
    return std::distance(ms_cache.begin(), itr);

  ms_cache.push_back({ name, std::nullopt });

  return ms_cache.size() - 1;
}

void
debugging_option_c::invalidate_cache() {
  for (auto &option : ms_cache)
    option.requested.reset();
}
