/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   JSON helper routines
*/

#include "ltag/common_pch.h"

#include <clocale>

#include "ltag/json.h"

namespace ltag::json {

namespace {

// Switches LC_NUMERIC to "C" for its lifetime so that numbers are read
// and written with '.' as the decimal separator.
class c_numeric_locale_c {
private:
  std::string m_previous;

public:
  c_numeric_locale_c() {
    auto previous = ::setlocale(LC_NUMERIC, nullptr);
    m_previous    = previous ? previous : "C";
    ::setlocale(LC_NUMERIC, "C");
  }

  ~c_numeric_locale_c() {
    ::setlocale(LC_NUMERIC, m_previous.c_str());
  }

  c_numeric_locale_c(c_numeric_locale_c const &) = delete;
  c_numeric_locale_c &operator =(c_numeric_locale_c const &) = delete;
};

}

nlohmann::json
parse(nlohmann::json::string_t const &data,
      nlohmann::json::parser_callback_t callback) {
  c_numeric_locale_c locale;

  return nlohmann::json::parse(data, callback, true, true); // allow exceptions & comments
}

nlohmann::json::string_t
dump(nlohmann::json const &json,
     int indentation) {
  c_numeric_locale_c locale;

  // invalid UTF-8 gets replaced, not rejected
  return json.dump(indentation, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace ltag::json
