/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   debug logging to standard error or to a file
*/

#pragma once

#include "ltag/common_pch.h"

namespace ltag::log {

class target_c;
using target_cptr = std::shared_ptr<target_c>;

/** \brief Destination for log lines

   Each message is turned into one line carrying the program name, the
   wall clock time and the milliseconds since \c init().

   The process wide default target is created on first use from the
   environment variable \c LTAG_LOGGER: \c stderr (the default) or
   <tt>file[:name]</tt>. Relative file names are placed in the temporary
   directory; the default name is \c ltag-debug.txt.
*/
class target_c {
protected:
  static target_cptr ms_default_target;

public:
  virtual ~target_c() = default;

  void log(std::string const &message);

protected:
  virtual std::string format_line(std::string const &message);
  virtual void write(std::string const &line) = 0;

public:
  static target_c &get_default_logger();
  static void set_default_logger(target_cptr const &target);
  static target_cptr create(std::string const &description);
  static int64_t runtime();
};

class file_target_c: public target_c {
protected:
  boost::filesystem::path m_file_name;

public:
  explicit file_target_c(boost::filesystem::path file_name);

  boost::filesystem::path const &get_file_name() const;

protected:
  virtual void write(std::string const &line) override;
};

class stderr_target_c: public target_c {
protected:
  virtual void write(std::string const &line) override;
};

template<typename T>
target_c &
operator <<(target_c &target,
            T const &message) {
  target.log(fmt::format("{0}", message));
  return target;
}

void init();

}

#define log_it(arg)            ltag::log::target_c::get_default_logger() << (arg)
