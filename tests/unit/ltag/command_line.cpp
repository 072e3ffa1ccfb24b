#include "ltag/common_pch.h"

#include <boost/filesystem/fstream.hpp>

#include "ltag/command_line.h"

#include "tests/unit/init.h"

namespace {

class CommandLineTest: public ::testing::Test {
protected:
  boost::filesystem::path m_option_file;

  virtual void SetUp() override {
    m_option_file = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("ltag-options-%%%%-%%%%.json");
    verbose       = 0;
  }

  virtual void TearDown() override {
    boost::system::error_code ec;
    boost::filesystem::remove(m_option_file, ec);

    debugging_c::request("!");
    verbose = 1;
  }

  void write_option_file(std::string const &content) {
    boost::filesystem::ofstream out{m_option_file, std::ios::out | std::ios::trunc | std::ios::binary};
    out << content;
  }
};

TEST_F(CommandLineTest, ReadingArgsFromJSONFiles) {
  write_option_file("// options\n[ \"--canonicalize\", \"i-klingon\" ]\n");

  std::vector<std::string> args{ "--validate" };
  ltag::cli::read_args_from_json_file(args, m_option_file.string());

  EXPECT_EQ((std::vector<std::string>{ "--validate", "--canonicalize", "i-klingon" }), args);
}

TEST_F(CommandLineTest, ReadingArgsFromInvalidJSONFiles) {
  std::vector<std::string> args;

  write_option_file("{ \"tag\": \"en\" }");
  EXPECT_THROW(ltag::cli::read_args_from_json_file(args, m_option_file.string()), ltagut::mxerror_x);

  write_option_file("[ \"en\", 42 ]");
  EXPECT_THROW(ltag::cli::read_args_from_json_file(args, m_option_file.string()), ltagut::mxerror_x);

  write_option_file("[ \"en\"");
  EXPECT_THROW(ltag::cli::read_args_from_json_file(args, m_option_file.string()), ltagut::mxerror_x);
}

TEST_F(CommandLineTest, ReadingArgsFromMissingFiles) {
  std::vector<std::string> args;

  EXPECT_THROW(ltag::cli::read_args_from_json_file(args, (m_option_file.parent_path() / "does-not-exist" / "options.json").string()), ltagut::mxerror_x);
}

TEST_F(CommandLineTest, ExpandingArgs) {
  write_option_file("[ \"de-AT\" ]");

  auto option_arg = "@"s + m_option_file.string();
  std::vector<std::string> storage{ "ltagtool", "-c", "@@en", option_arg, "fr" };
  std::vector<char *> argv;

  for (auto &arg : storage)
    argv.push_back(&arg[0]);

  auto args = ltag::cli::args_in_utf8(argv.size(), argv.data());

  EXPECT_EQ((std::vector<std::string>{ "-c", "@en", "de-AT", "fr" }), args);
}

TEST_F(CommandLineTest, HandlingCommonArgs) {
  std::vector<std::string> args{ "-v", "--debug", "parser", "--abort-on-warnings", "-c", "en", "-v" };

  ltag::cli::handle_common_args(args);

  EXPECT_EQ((std::vector<std::string>{ "-c", "en" }), args);
  EXPECT_EQ(2u, verbose);
  EXPECT_TRUE(debugging_c::requested("parser"));
  EXPECT_TRUE(ltag::cli::g_abort_on_warnings);
}

TEST_F(CommandLineTest, HandlingCommonArgsWithMissingDebugArgument) {
  std::vector<std::string> args{ "en", "--debug" };

  EXPECT_THROW(ltag::cli::handle_common_args(args), ltagut::mxerror_x);
}

}
