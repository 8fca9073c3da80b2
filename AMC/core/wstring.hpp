#ifndef AMC_WSTRING_HPP
#define AMC_WSTRING_HPP

#include <string>
#include <string_view>

#include <boost/locale/encoding_utf.hpp>

namespace amc {

/// @brief narrowing character converter
///
/// Converts a UTF-encoded wide string to a UTF-8 encoded std::string
inline std::string to_string(std::wstring_view wstr_utf) {
  using boost::locale::conv::utf_to_utf;
  return utf_to_utf<char>(wstr_utf.data(), wstr_utf.data() + wstr_utf.size());
}

/// @brief widening character converter
///
/// Converts a UTF-8 encoded string to a std::wstring
inline std::wstring to_wstring(std::string_view str_utf8) {
  using boost::locale::conv::utf_to_utf;
  return utf_to_utf<wchar_t>(str_utf8.data(),
                             str_utf8.data() + str_utf8.size());
}

}  // namespace amc

#endif  // AMC_WSTRING_HPP
