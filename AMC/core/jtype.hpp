#ifndef AMC_CORE_JTYPE_HPP
#define AMC_CORE_JTYPE_HPP

#include <string>

namespace amc {

/// kind of values an angular momentum can take
enum class JType { Integer, HalfInteger };

/// @return the type of the angular momentum obtained by coupling angular
/// momenta of types @p t1 and @p t2
constexpr JType coupled_type(JType t1, JType t2) {
  return t1 == t2 ? JType::Integer : JType::HalfInteger;
}

/// @return the modulus of phase exponents of an angular momentum of type @p t,
/// i.e. the smallest k such that \f$ (-1)^{k j} = 1 \f$ for all j
constexpr int phase_modulus(JType t) { return t == JType::Integer ? 2 : 4; }

inline std::wstring to_wstring(JType t) {
  return t == JType::Integer ? L"int" : L"hint";
}

namespace detail {

/// non-negative remainder of @p a modulo @p m
constexpr int floor_mod(int a, int m) { return ((a % m) + m) % m; }

}  // namespace detail

}  // namespace amc

#endif  // AMC_CORE_JTYPE_HPP
