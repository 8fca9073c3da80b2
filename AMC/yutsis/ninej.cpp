#include <AMC/yutsis/ninej.hpp>

#include <AMC/yutsis/exception.hpp>

#include <AMC/core/container.hpp>

#include <range/v3/algorithm/find.hpp>

#include <utility>

namespace amc::yutsis {

NineJ::NineJ(IdxArena& arena, std::array<IdxId, 9> indices)
    : indices_(indices) {
  canonicalize(arena);
}

void NineJ::canonicalize(IdxArena& arena) {
  container::svector<IdxId, 9> integers;
  for (auto id : indices_) {
    if (arena[id].type == JType::Integer) integers.push_back(id);
  }
  if (integers.size() != 3) return;

  // { j1 j3 J3 }
  // { j2 J2 j6 }
  // { J1 j4 j5 }
  place_index(integers[0], 6, arena);
  place_index(integers[1], 4, arena);
  place_index(integers[2], 2, arena);
}

bool NineJ::contains(IdxId id) const {
  return ranges::find(indices_, id) != indices_.end();
}

void NineJ::place_index(IdxId id, std::size_t pos, IdxArena& arena) {
  auto it = ranges::find(indices_, id);
  if (it == indices_.end() || pos > 8)
    throw InvariantViolation("NineJ::place_index: invalid index or position");
  const auto current = static_cast<std::size_t>(it - indices_.begin());

  if (current % 3 != pos % 3) swap_columns(current % 3, pos % 3, arena);
  if (current / 3 != pos / 3) swap_rows(current / 3, pos / 3, arena);
}

void NineJ::add_permutation_phase(IdxArena& arena) const {
  for (auto id : indices_) arena[id].jphase += 1;
}

void NineJ::swap_columns(std::size_t col1, std::size_t col2,
                         IdxArena& arena) {
  if (col1 > 2 || col2 > 2)
    throw InvariantViolation("NineJ::swap_columns: invalid column");
  if (col1 == col2) return;
  for (std::size_t row = 0; row != 3; ++row)
    std::swap(indices_[3 * row + col1], indices_[3 * row + col2]);
  add_permutation_phase(arena);
}

void NineJ::swap_rows(std::size_t row1, std::size_t row2, IdxArena& arena) {
  if (row1 > 2 || row2 > 2)
    throw InvariantViolation("NineJ::swap_rows: invalid row");
  if (row1 == row2) return;
  for (std::size_t col = 0; col != 3; ++col)
    std::swap(indices_[3 * row1 + col], indices_[3 * row2 + col]);
  add_permutation_phase(arena);
}

void NineJ::reflect_main_diagonal() {
  std::swap(indices_[1], indices_[3]);
  std::swap(indices_[2], indices_[6]);
  std::swap(indices_[5], indices_[7]);
}

void NineJ::reflect_anti_diagonal() {
  std::swap(indices_[0], indices_[8]);
  std::swap(indices_[1], indices_[5]);
  std::swap(indices_[3], indices_[7]);
}

std::wstring NineJ::to_wstring(const IdxArena& arena) const {
  std::wstring result = L"NineJ(";
  for (std::size_t k = 0; k != 9; ++k) {
    if (k != 0) result += k % 3 == 0 ? L"; " : L" ";
    result += arena[indices_[k]].label;
  }
  return result + L")";
}

}  // namespace amc::yutsis
