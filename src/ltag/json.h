/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   JSON helper routines
*/

#pragma once

#include "ltag/common_pch.h"

#include <nlohmann/json.hpp>

namespace ltag::json {

nlohmann::json parse(nlohmann::json::string_t const &data, nlohmann::json::parser_callback_t callback = nullptr);
nlohmann::json::string_t dump(nlohmann::json const &json, int indentation = 0);

} // namespace ltag::json
