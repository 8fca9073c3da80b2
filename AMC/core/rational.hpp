#ifndef AMC_CORE_RATIONAL_HPP
#define AMC_CORE_RATIONAL_HPP

#include <AMC/core/wstring.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <string>
#include <string_view>

namespace amc {

using rational = boost::multiprecision::cpp_rational;

/// @return the wide-string form of @p r, e.g. `-3/2`
inline std::wstring to_wstring(const rational& r) {
  const auto str = r.str();
  return to_wstring(std::string_view(str));
}

}  // namespace amc

#endif  // AMC_CORE_RATIONAL_HPP
