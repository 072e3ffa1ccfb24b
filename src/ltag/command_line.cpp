/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   command line helper functions
*/

#include "ltag/common_pch.h"

#include <iterator>

#include <boost/filesystem/fstream.hpp>

#include "ltag/command_line.h"
#include "ltag/json.h"
#include "ltag/version.h"

namespace ltag::cli {

std::string g_usage_text;
bool g_abort_on_warnings = false;

/** \brief Append the arguments stored in a JSON option file

   The file must contain a single JSON array of strings. Comments are
   allowed. Any error is fatal.
*/
void
read_args_from_json_file(std::vector<std::string> &args,
                         std::string const &file_name) {
  boost::filesystem::ifstream in{boost::filesystem::path{file_name}, std::ios::in | std::ios::binary};
  if (!in)
    mxerror(fmt::format(FY("The file '{0}' could not be opened for reading.\n"), file_name));

  auto content = std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};

  try {
    auto doc       = ltag::json::parse(content);
    auto all_valid = doc.is_array() && std::all_of(doc.begin(), doc.end(), [](auto const &element) { return element.is_string(); });

    if (!all_valid)
      throw std::domain_error{Y("JSON option files must contain a JSON array consisting solely of JSON strings")};

    for (auto const &element : doc)
      args.emplace_back(element.get<std::string>());

  } catch (std::exception const &ex) {
    mxerror(fmt::format(FY("The JSON option file '{0}' contains an error: {1}.\n"), file_name, ex.what()));
  }
}

/** \brief Collect the command line arguments

   An argument "@file.json" is replaced by the arguments stored in that
   JSON option file. An argument starting with "@@" is taken literally
   without its first '@'.
*/
std::vector<std::string>
args_in_utf8(int argc,
             char **argv) {
  std::vector<std::string> args;

  for (int idx = 1; idx < argc; ++idx) {
    std::string arg{argv[idx]};

    if (balg::starts_with(arg, "@@"))
      args.emplace_back(arg.substr(1));

    else if (balg::starts_with(arg, "@"))
      read_args_from_json_file(args, arg.substr(1));

    else
      args.emplace_back(std::move(arg));
  }

  return args;
}

/** \brief Handle the options every program understands

   These are --debug, --abort-on-warnings, --verbose, --quiet, --help and
   --version along with their short forms. Handled options are removed
   from \c args. --debug and --abort-on-warnings are processed before
   the others so that they are in effect for them.
*/
void
handle_common_args(std::vector<std::string> &args) {
  std::vector<std::string> remaining;

  for (auto current = args.begin(), end = args.end(); current != end; ++current) {
    if (*current == "--debug") {
      if ((current + 1) == end)
        mxerror(Y("Missing argument for '--debug'.\n"));

      else
        debugging_c::request(*++current);

    } else if (*current == "--abort-on-warnings")
      g_abort_on_warnings = true;

    else
      remaining.emplace_back(*current);
  }

  args.clear();

  for (auto const &arg : remaining) {
    if ((arg == "-V") || (arg == "--version")) {
      mxinfo(fmt::format("{0}\n", get_version_info(get_program_name(), vif_full)));
      mxexit();

    } else if ((arg == "-h") || (arg == "-?") || (arg == "--help"))
      display_usage();

    else if ((arg == "-v") || (arg == "--verbose"))
      ++verbose;

    else if ((arg == "-q") || (arg == "--quiet")) {
      verbose         = 0;
      g_suppress_info = true;

    } else
      args.emplace_back(arg);
  }
}

void
display_usage(int exit_code) {
  if (!g_usage_text.empty())
    mxinfo(balg::ends_with(g_usage_text, "\n") ? g_usage_text : g_usage_text + "\n");

  mxexit(exit_code);
}

}
