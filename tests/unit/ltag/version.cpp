#include "ltag/common_pch.h"

#include "ltag/version.h"

#include "tests/unit/init.h"

namespace {

TEST(Version, Plain) {
  EXPECT_EQ(fmt::format("ltagtool v{0}", LTAG_VERSION), get_version_info("ltagtool", vif_none));
  EXPECT_EQ(fmt::format("v{0}", LTAG_VERSION),          get_version_info("", vif_none));
}

TEST(Version, WithArchitecture) {
  EXPECT_EQ(fmt::format("ltagtool v{0} {1}-bit", LTAG_VERSION, sizeof(void *) * 8), get_version_info("ltagtool"));
  EXPECT_EQ(get_version_info("ltagtool"), get_version_info("ltagtool", vif_full));
}

}
