#ifndef AMC_YUTSIS_TRIANGULAR_DELTA_HPP
#define AMC_YUTSIS_TRIANGULAR_DELTA_HPP

#include <AMC/yutsis/idx.hpp>

#include <array>
#include <string>

namespace amc::yutsis {

/// triangle condition \f$ \{ j_1 j_2 j_3 \} \f$ on three indices
struct TriangularDelta {
  std::array<IdxId, 3> indices;

  bool contains(IdxId id) const {
    return indices[0] == id || indices[1] == id || indices[2] == id;
  }

  std::wstring to_wstring(const IdxArena& arena) const {
    return L"{" + arena[indices[0]].label + L" " + arena[indices[1]].label +
           L" " + arena[indices[2]].label + L"}";
  }
};

}  // namespace amc::yutsis

#endif  // AMC_YUTSIS_TRIANGULAR_DELTA_HPP
