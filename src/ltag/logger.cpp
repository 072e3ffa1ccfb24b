/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   debug logging to standard error or to a file
*/

#include "ltag/common_pch.h"

#include <chrono>
#include <cstdlib>
#include <iostream>

#include <boost/filesystem/fstream.hpp>
#include <fmt/chrono.h>

#include "ltag/logger.h"
#include "ltag/strings/editing.h"

namespace ltag::log {

namespace {

std::chrono::steady_clock::time_point s_start{std::chrono::steady_clock::now()};

}

target_cptr target_c::ms_default_target;

void
target_c::log(std::string const &message) {
  write(format_line(message));
}

std::string
target_c::format_line(std::string const &message) {
  auto now  = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  auto line = fmt::format("[ltag] {0:%Y-%m-%d %H:%M:%S} +{1}ms {2}", fmt::localtime(now), runtime(), message);

  if (!balg::ends_with(line, "\n"))
    line += '\n';

  return line;
}

target_c &
target_c::get_default_logger() {
  if (!ms_default_target) {
    auto variable = std::getenv("LTAG_LOGGER");
    ms_default_target = create(variable ? variable : "");
  }

  return *ms_default_target;
}

void
target_c::set_default_logger(target_cptr const &target) {
  ms_default_target = target;
}

/** \brief Create a target from its textual description

   \param description Either "stderr", "file" or "file:name". Anything
     else, including an empty string, selects standard error.
*/
target_cptr
target_c::create(std::string const &description) {
  auto type_and_name = ltag::string::split(description, ":", 2);

  if (type_and_name[0] != "file")
    return std::make_shared<stderr_target_c>();

  auto file_name = (type_and_name.size() == 2) && !type_and_name[1].empty() ? type_and_name[1] : "ltag-debug.txt"s;

  return std::make_shared<file_target_c>(boost::filesystem::path{file_name});
}

int64_t
target_c::runtime() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - s_start).count();
}

// ------------------------------------------------------------

file_target_c::file_target_c(boost::filesystem::path file_name)
  : m_file_name{file_name.is_absolute() ? std::move(file_name) : boost::filesystem::temp_directory_path() / file_name}
{
  if (!boost::filesystem::is_regular_file(m_file_name))
    return;

  boost::system::error_code ec;
  boost::filesystem::remove(m_file_name, ec);

  if (ec)
    std::cerr << fmt::format("[ltag] Could not remove the old log file '{0}': {1}\n", m_file_name.string(), ec.message());
}

boost::filesystem::path const &
file_target_c::get_file_name()
  const {
  return m_file_name;
}

void
file_target_c::write(std::string const &line) {
  boost::filesystem::ofstream out{m_file_name, std::ios::out | std::ios::app | std::ios::binary};

  if (out)
    out << line;
  else
    std::cerr << fmt::format("[ltag] Could not open the log file '{0}'; message: {1}", m_file_name.string(), line);
}

// ------------------------------------------------------------

void
stderr_target_c::write(std::string const &line) {
  std::cerr << line;
}

// ------------------------------------------------------------

void
init() {
  s_start = std::chrono::steady_clock::now();
}

}
