/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   helper functions for unit tests
*/

#include "ltag/common_pch.h"

#include "ltag/command_line.h"
#include "ltag/output.h"

#include "tests/unit/init.h"

namespace ltagut {

static void
throwing_mxmsg_handler(unsigned int level,
                       std::string const &message) {
  if (MXMSG_WARNING == level)
    throw mxwarn_x{message};
  throw mxerror_x{message};
}

void
init_suite(char const *argv0) {
  ltag_common_init("ltag_unit_tests", argv0);

  g_suppress_info = true;

  set_mxmsg_handler(MXMSG_WARNING, throwing_mxmsg_handler);
  set_mxmsg_handler(MXMSG_ERROR,   throwing_mxmsg_handler);
}

void
init_case() {
  g_warning_issued               = false;
  ltag::cli::g_abort_on_warnings = false;
}

class case_listener_c: public ::testing::EmptyTestEventListener {
public:
  void OnTestStart(::testing::TestInfo const &) override {
    init_case();
  }
};

}

int
main(int argc,
     char **argv) {
  ::testing::InitGoogleTest(&argc, argv);

  ltagut::init_suite(argv[0]);
  ::testing::UnitTest::GetInstance()->listeners().Append(new ltagut::case_listener_c);

  return RUN_ALL_TESTS();
}
