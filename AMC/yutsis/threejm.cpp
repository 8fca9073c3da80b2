#include <AMC/yutsis/threejm.hpp>

#include <AMC/yutsis/exception.hpp>

#include <range/v3/algorithm/count.hpp>

#include <format>
#include <string>
#include <utility>

namespace amc::yutsis {

namespace {

std::wstring slots_to_wstring(const IdxArena& arena,
                              const std::array<IdxId, 3>& indices,
                              const std::array<int, 3>& signs) {
  auto slot = [&](std::size_t k) {
    return std::format(L"{}({})", arena[indices[k]].label,
                       signs[k] == 1 ? L'+' : L'-');
  };
  return slot(0) + L" " + slot(1) + L" " + slot(2);
}

}  // namespace

ThreeJM ClebschGordan::to_threejm(IdxArena& arena) const {
  auto result_signs = signs;

  arena[indices[0]].jphase += 1;
  arena[indices[1]].jphase -= 1;
  arena[indices[2]].mphase += signs[2];
  arena[indices[2]].jhat += 1;
  result_signs[2] = -result_signs[2];

  // every negative projection carries (-1)^{j-m}
  for (std::size_t k = 0; k != 3; ++k) {
    if (result_signs[k] == -1) {
      arena[indices[k]].jphase += 1;
      arena[indices[k]].mphase -= 1;
    }
  }

  return ThreeJM(indices, result_signs);
}

std::wstring ClebschGordan::to_wstring(const IdxArena& arena) const {
  return L"CG: " + slots_to_wstring(arena, indices, signs);
}

ThreeJM::ThreeJM(std::array<IdxId, 3> indices, std::array<int, 3> signs)
    : indices_(indices), signs_(signs) {
  for (auto s : signs_) {
    if (s != 1 && s != -1)
      throw InvariantViolation("ThreeJM: projection signs must be +1 or -1");
  }
}

std::size_t ThreeJM::count(IdxId id) const {
  return static_cast<std::size_t>(ranges::count(indices_, id));
}

void ThreeJM::exchange(std::size_t k1, std::size_t k2, IdxArena& arena) {
  if (k1 > 2 || k2 > 2)
    throw InvariantViolation("ThreeJM::exchange: invalid slot");
  if (k1 == k2) return;

  std::swap(indices_[k1], indices_[k2]);
  std::swap(signs_[k1], signs_[k2]);

  for (auto id : indices_) arena[id].jphase += 1;
}

void ThreeJM::flip_signs(IdxArena& arena) {
  for (std::size_t k = 0; k != 3; ++k) {
    signs_[k] = -signs_[k];
    if (signs_[k] == 1) arena[indices_[k]].jphase += 2;
  }
}

std::wstring ThreeJM::to_wstring(const IdxArena& arena) const {
  return L"3JM: " + slots_to_wstring(arena, indices_, signs_);
}

}  // namespace amc::yutsis
