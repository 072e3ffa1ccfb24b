/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   precompiled header: everything all translation units need
*/

#pragma once

#include "ltag/common.h"

#include <array>
#include <bitset>
#include <iostream>
#include <limits>
#include <map>
#include <sstream>
#include <string_view>
#include <unordered_map>
#include <utility>
