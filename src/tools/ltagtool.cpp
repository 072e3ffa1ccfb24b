/*
   ltagtool - A tool for parsing, validating and canonicalizing BCP 47 language tags

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html
*/

#include "ltag/common_pch.h"

#include "ltag/bcp47.h"
#include "ltag/bcp47_json.h"
#include "ltag/command_line.h"
#include "ltag/json.h"
#include "ltag/strings/formatting.h"

using language_tag_c = ltag::bcp47::language_tag_c;

class cli_options_c {
public:
  std::vector<std::string> m_tags;
  std::optional<language_tag_c> m_range;
  bool m_canonicalize{}, m_validate{}, m_components{}, m_json{};
};

static debugging_option_c s_debug{"ltagtool"};

static void
setup_help() {
  ltag::cli::g_usage_text = "ltagtool [options] <tag> [<tag> ...]\n"
                            "\n"
                            "Parses BCP 47 language tags and prints them in their normalized form.\n"
                            "\n"
                            "Tag options:\n"
                            "\n"
                            "  -c, --canonicalize     Print the canonical form of each tag\n"
                            "  -m, --match <range>    Report whether the language range <range>\n"
                            "                         matches each tag\n"
                            "  --validate             Also run the validity checks\n"
                            "  --components           Print each component of every tag\n"
                            "  -J, --json             Output results as JSON\n"
                            "\n"
                            "General options:\n"
                            "\n"
                            "  --debug <topic>        Turn on debugging output for <topic>\n"
                            "  --abort-on-warnings    Abort at the first warning\n"
                            "  -v, --verbose          Increase verbosity\n"
                            "  -q, --quiet            Suppress status output\n"
                            "  -h, --help             This help text\n"
                            "  -V, --version          Print version information\n"
                            "  @file.json             Read additional arguments from a JSON option file\n";
}

static language_tag_c
parse_range(std::string const &text) {
  auto result = language_tag_c::parse(text);

  if (!result)
    mxerror(fmt::format(FY("The language range '{0}' is not well-formed: {1}\n"), text, result.get_error()));

  if (!result->is_language_range())
    mxerror(fmt::format(FY("'{0}' cannot be used as a language range as it contains extension or private use subtags.\n"), text));

  return result.get();
}

static cli_options_c
parse_args(std::vector<std::string> &args) {
  auto options = cli_options_c{};

  for (auto current = args.begin(), end = args.end(); current != end; ++current) {
    auto arg      = *current;
    auto next     = current + 1;
    auto next_arg = next != end ? *next : "";

    if ((arg == "-c") || (arg == "--canonicalize"))
      options.m_canonicalize = true;

    else if ((arg == "-m") || (arg == "--match")) {
      if (next_arg.empty())
        mxerror(fmt::format(FY("Missing argument to {0}\n"), arg));

      options.m_range = parse_range(next_arg);
      ++current;

    } else if (arg == "--validate")
      options.m_validate = true;

    else if (arg == "--components")
      options.m_components = true;

    else if ((arg == "-J") || (arg == "--json"))
      options.m_json = true;

    else if ((arg.size() > 1) && (arg[0] == '-'))
      mxerror(fmt::format(FY("Unknown option '{0}'.\n"), arg));

    else
      options.m_tags.emplace_back(arg);
  }

  if (options.m_tags.empty())
    mxerror(Y("No language tag given.\n"));

  return options;
}

static std::vector<std::pair<std::string, std::string>>
list_components(language_tag_c const &tag) {
  std::vector<std::pair<std::string, std::string>> components{
    { "language"s,          tag.get_primary_language()  },
    { "extended_language"s, tag.get_extended_language() },
    { "script"s,            tag.get_script()            },
    { "region"s,            tag.get_region()            },
    { "variant"s,           tag.get_variant()           },
    { "extension"s,         tag.get_extension()         },
    { "private_use"s,       tag.get_private_use()       },
  };

  components.erase(std::remove_if(components.begin(), components.end(), [](auto const &component) { return component.second.empty(); }), components.end());

  return components;
}

static nlohmann::json
process_tag(cli_options_c const &options,
            std::string const &text) {
  auto result = language_tag_c::parse(text);

  if (!result)
    mxerror(fmt::format(FY("The language tag '{0}' is not well-formed: {1}\n"), text, result.get_error()));

  auto const &tag = result.get();

  mxdebug_if(s_debug, fmt::format("parsed '{0}': {1}\n", text, tag.dump()));

  auto json = nlohmann::json{
    { "input", text },
    { "tag",   tag  },
  };

  if (!options.m_json)
    mxinfo(fmt::format("{0}\n", tag));

  if (options.m_canonicalize) {
    auto canonical = tag.canonicalize();

    mxdebug_if(s_debug, fmt::format("canonical form of '{0}': {1}\n", tag, canonical.dump()));

    json["canonical"] = canonical;
    if (!options.m_json)
      mxinfo(fmt::format(FY("  canonical form: {0}\n"), canonical));
  }

  if (options.m_components) {
    auto components = nlohmann::json::object();

    for (auto const &[name, value] : list_components(tag)) {
      components[name] = value;
      if (!options.m_json)
        mxinfo(fmt::format("  {0}: {1}\n", name, value));
    }

    auto extensions = nlohmann::json::array();
    for (auto const &extension : tag.get_extensions())
      extensions.push_back(nlohmann::json{
        { "identifier", std::string(1, extension.identifier) },
        { "values",     extension.values                     },
      });

    if (!extensions.empty())
      components["extensions"] = extensions;

    auto private_use = tag.get_private_use_subtags();
    if (!private_use.empty())
      components["private_use_subtags"] = private_use;

    json["components"] = components;
  }

  if (options.m_validate) {
    auto error    = tag.validate();
    json["valid"] = !error;

    if (error) {
      json["validation_error"] = ltag::bcp47::to_string(*error);
      mxwarn(fmt::format(FY("The language tag '{0}' is not valid: {1}\n"), tag, *error));

    } else if (!options.m_json && (verbose > 1))
      mxinfo(fmt::format(FY("  The language tag '{0}' is valid.\n"), tag));
  }

  if (options.m_range) {
    auto matches    = options.m_range->matches(tag);
    json["matches"] = matches;

    if (!matches)
      mxwarn(fmt::format(FY("The language range '{0}' does not match '{1}'.\n"), *options.m_range, tag));

    else if (!options.m_json)
      mxinfo(fmt::format(FY("  The language range '{0}' matches '{1}'.\n"), *options.m_range, tag));
  }

  return json;
}

int
main(int argc,
     char **argv) {
  ltag_common_init("ltagtool", argv[0]);
  setup_help();

  auto args = ltag::cli::args_in_utf8(argc, argv);
  ltag::cli::handle_common_args(args);

  auto options = parse_args(args);

  if (options.m_json)
    redirect_warnings_and_errors_to_json();

  auto tags = nlohmann::json::array();

  for (auto const &text : options.m_tags)
    tags.push_back(process_tag(options, text));

  if (options.m_json) {
    auto json = nlohmann::json{
      { "tags", tags },
    };

    if (options.m_range)
      json["range"] = *options.m_range;

    display_json_output(json);
  }

  mxexit();
}
