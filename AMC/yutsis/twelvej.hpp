#ifndef AMC_YUTSIS_TWELVEJ_HPP
#define AMC_YUTSIS_TWELVEJ_HPP

#include <AMC/yutsis/idx.hpp>

#include <array>
#include <cstddef>
#include <string>

namespace amc::yutsis {

/// @brief 12j-symbol of the first kind, laid out as
/// ```
/// { j1   j2   j3   j4     }
/// {   j5   j6   j7   j8   }
/// { j9   j10  j11  j12    }
/// ```
struct TwelveJFirst {
  std::array<IdxId, 12> indices;

  std::wstring to_wstring(const IdxArena& arena) const {
    std::wstring result = L"TwelveJFirst(";
    for (std::size_t k = 0; k != 12; ++k) {
      if (k != 0) result += k % 4 == 0 ? L"; " : L" ";
      result += arena[indices[k]].label;
    }
    return result + L")";
  }
};

}  // namespace amc::yutsis

#endif  // AMC_YUTSIS_TWELVEJ_HPP
