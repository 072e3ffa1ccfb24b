/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   exception classes for programming errors
*/

#pragma once

#include "ltag/common_pch.h"

#include <ostream>

namespace ltag {

/** \brief Base class of all exceptions thrown by the library

   Malformed input is never reported by exceptions; parsers return
   error codes for that. Exceptions signal that an API was used in a way
   its preconditions forbid.
*/
class exception: public std::exception {
public:
  virtual char const *what() const noexcept override {
    return "unspecified ltag error";
  }

  virtual std::string error() const {
    return what();
  }
};

class invalid_parameter_x: public exception {
protected:
  std::string m_message{"invalid parameter in function call"};

public:
  invalid_parameter_x() = default;
  explicit invalid_parameter_x(std::string message)
    : m_message{std::move(message)}
  {
  }

  virtual char const *what() const noexcept override {
    return m_message.c_str();
  }
};

inline std::ostream &
operator <<(std::ostream &out,
            exception const &ex) {
  return out << ex.error();
}

}

#if FMT_VERSION >= 90000
template <> struct fmt::formatter<ltag::exception> : ostream_formatter {};
#endif  // FMT_VERSION >= 90000
