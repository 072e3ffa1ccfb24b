/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   BCP 47 language tags
*/

#pragma once

#include "ltag/common_pch.h"

#include <string_view>

namespace ltag::bcp47 {

enum class parse_error_e {
  empty_subtag,
  subtag_too_long,
  invalid_language,
  invalid_subtag,
  too_many_extlangs,
  empty_extension,
  empty_private_use,
  forbidden_char,
};

enum class validation_error_e {
  duplicate_variant,
  duplicate_extension,
  multiple_extended_language_subtags,
};

std::string to_string(parse_error_e error);
std::string to_string(validation_error_e error);

class parse_result_c;

/** \brief A well-formed language tag as described in RFC 5646

   The tag stores its normalized serialization only. Six offsets mark
   the end of each component within it in grammar order; a component
   whose start equals its end is absent. Components are never stored
   separately, all accessors slice the serialization.

   Instances are created by \c parse() or \c canonicalize() only and
   cannot be modified afterwards.
*/
class language_tag_c {
public:
  struct extension_t {
    char identifier{};
    std::vector<std::string> values;

    std::string format() const;

    bool operator ==(extension_t const &other) const noexcept;
    bool operator !=(extension_t const &other) const noexcept;
  };

protected:
  std::string m_serialization;
  std::size_t m_language_end{}, m_extlang_end{}, m_script_end{}, m_region_end{}, m_variant_end{}, m_extension_end{};

protected:
  language_tag_c(std::string serialization, std::size_t language_end, std::size_t extlang_end, std::size_t script_end, std::size_t region_end, std::size_t variant_end, std::size_t extension_end);

public:
  std::string const &format() const noexcept;
  std::string const &as_text() const noexcept;
  std::string release() &&;
  std::string dump() const;

  std::string get_primary_language() const;
  std::string get_extended_language() const;
  std::vector<std::string> get_extended_language_subtags() const;
  std::string get_full_language() const;
  std::string get_script() const;
  std::string get_region() const;
  std::string get_variant() const;
  std::vector<std::string> get_variant_subtags() const;
  std::string get_extension() const;
  std::vector<extension_t> get_extensions() const;
  std::string get_private_use() const;
  std::vector<std::string> get_private_use_subtags() const;

  bool is_grandfathered() const noexcept;
  bool is_private_use_only() const noexcept;
  bool is_language_range() const noexcept;

  std::optional<validation_error_e> validate() const;
  bool is_valid() const;

  language_tag_c canonicalize() const;

  bool matches(language_tag_c const &tag) const;

  bool operator ==(language_tag_c const &other) const noexcept;
  bool operator !=(language_tag_c const &other) const noexcept;

protected:
  std::string_view slice(std::size_t start, std::size_t end) const;
  std::string_view component(std::size_t previous_end, std::size_t end) const;

  static language_tag_c from_single_component(std::string serialization);
  static parse_result_c parse_private_use_only(std::string const &text);
  static parse_result_c parse_regular(std::string const &text);

public:
  static parse_result_c parse(std::string const &text);
};

/** \brief The outcome of \c language_tag_c::parse()

   Holds either a language tag or the reason why the input is not
   well-formed. Asking a failed result for its tag or a successful one
   for its error throws \c ltag::invalid_parameter_x.
*/
class parse_result_c {
private:
  std::optional<language_tag_c> m_tag;
  std::optional<parse_error_e> m_error;

public:
  parse_result_c(language_tag_c tag);
  parse_result_c(parse_error_e error);

  bool is_ok() const noexcept;
  explicit operator bool() const noexcept;

  language_tag_c const &get() const;
  language_tag_c const &operator *() const;
  language_tag_c const *operator ->() const;
  parse_error_e get_error() const;
};

inline std::ostream &
operator <<(std::ostream &out,
            language_tag_c::extension_t const &extension) {
  out << extension.format();
  return out;
}

inline std::ostream &
operator <<(std::ostream &out,
            language_tag_c const &tag) {
  out << tag.format();
  return out;
}

inline std::ostream &
operator <<(std::ostream &out,
            parse_error_e error) {
  out << to_string(error);
  return out;
}

inline std::ostream &
operator <<(std::ostream &out,
            validation_error_e error) {
  out << to_string(error);
  return out;
}

inline bool
operator <(language_tag_c const &a,
           language_tag_c const &b) {
  return a.format() < b.format();
}

} // namespace ltag::bcp47

namespace std {

template<>
struct hash<ltag::bcp47::language_tag_c> {
  std::size_t operator()(ltag::bcp47::language_tag_c const &key) const {
    return std::hash<std::string>()(key.format());
  }
};

} // namespace std

#if FMT_VERSION >= 90000
template <> struct fmt::formatter<ltag::bcp47::language_tag_c::extension_t> : ostream_formatter {};
template <> struct fmt::formatter<ltag::bcp47::language_tag_c>              : ostream_formatter {};
template <> struct fmt::formatter<ltag::bcp47::parse_error_e>               : ostream_formatter {};
template <> struct fmt::formatter<ltag::bcp47::validation_error_e>          : ostream_formatter {};
#endif  // FMT_VERSION >= 90000
