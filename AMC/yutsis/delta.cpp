#include <AMC/yutsis/delta.hpp>

#include <AMC/yutsis/exception.hpp>

#include <format>
#include <string>
#include <tuple>
#include <utility>

namespace amc::yutsis {

Delta::Delta(const IdxArena& arena, IdxId idx1, IdxId idx2)
    : indices_{idx1, idx2} {
  const auto& i1 = arena[idx1];
  const auto& i2 = arena[idx2];
  if (i1.type != i2.type)
    throw InvariantViolation("Delta: indices must have the same type");

  auto key = [](const Idx& idx) {
    return std::tuple<int, int, const std::wstring&>(
        idx.zero ? 0 : 1, idx.external ? 0 : 1, idx.label);
  };
  if (key(i2) < key(i1)) std::swap(indices_[0], indices_[1]);
}

void Delta::apply(IdxArena& arena) const {
  arena[first()].absorb(arena[second()]);
}

std::wstring Delta::to_wstring(const IdxArena& arena) const {
  return std::format(L"delta({}, {})", arena[first()].label,
                     arena[second()].label);
}

}  // namespace amc::yutsis
