#include <AMC/core/term.hpp>

namespace amc {

namespace detail {

std::wstring summation_to_wstring(const container::vector<Index>& summation) {
  if (summation.empty()) return {};
  std::wstring result = L"sum_{";
  for (std::size_t k = 0; k != summation.size(); ++k) {
    if (k != 0) result += L" ";
    result += summation[k].label();
  }
  return result + L"} ";
}

}  // namespace detail

std::wstring Term::to_wstring() const {
  std::wstring result = amc::to_wstring(prefactor) + L" " +
                        detail::summation_to_wstring(summation);
  for (std::size_t k = 0; k != factors.size(); ++k) {
    if (k != 0) result += L" ";
    result += factors[k].to_wstring();
  }
  return result;
}

std::wstring Equation::to_wstring() const {
  std::wstring result = lhs.to_wstring() + L" =";
  if (terms.empty()) return result + L" 0";
  for (std::size_t k = 0; k != terms.size(); ++k) {
    result += k == 0 ? L" " : L" + ";
    result += terms[k].to_wstring();
  }
  return result;
}

}  // namespace amc
