/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   debug options requested on the command line or via the environment
*/

#pragma once

#include "ltag/common_pch.h"

#include <map>

/** \brief Registry of the debug options currently requested

   Options are requested as a comma separated list, e.g.
   <tt>--debug ltagtool,timestamped_messages</tt>. An option can carry an
   argument (<tt>name=value</tt>). The pseudo option \c ! clears all
   options and \c to_logger sends debug output to the logger instead of
   standard output.
*/
class debugging_c {
protected:
  static bool ms_send_to_logger;
  static std::map<std::string, std::string> ms_options;

public:
  static void init();

  static void request(std::string const &options, bool enable = true);
  static bool requested(std::string const &alternatives, std::string *arg = nullptr);

  static void send_to_logger(bool enable);
  static void output(std::string const &message);
};

/** \brief A single debug option with a cached lookup

   Meant to be used as a static variable; evaluating it as a boolean only
   consults \c debugging_c after the requested options have changed.
*/
class debugging_option_c {
private:
  struct cached_option_t {
    std::string name;
    std::optional<bool> requested;
  };

  static std::vector<cached_option_t> ms_cache;

protected:
  std::string m_name;
  mutable std::optional<std::size_t> m_cache_idx;

public:
  debugging_option_c(std::string name)
    : m_name{std::move(name)}
  {
  }

  operator bool() const;
  void set(std::optional<bool> requested);

protected:
  cached_option_t &cached() const;

public:
  static std::size_t register_option(std::string const &name);
  static void invalidate_cache();
};

#define mxdebug(msg) debugging_c::output(fmt::format("Debug> {0}:{1:04}: {2}", __FILE__, __LINE__, msg))

#define mxdebug_if(condition, msg) \
  if (condition) {                 \
    mxdebug(msg);                  \
  }
