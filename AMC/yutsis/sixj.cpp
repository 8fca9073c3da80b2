#include <AMC/yutsis/sixj.hpp>

#include <AMC/yutsis/exception.hpp>

#include <AMC/core/container.hpp>

#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/algorithm/find.hpp>
#include <range/v3/algorithm/sort.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace amc::yutsis {

SixJ::SixJ(const IdxArena& arena, std::array<IdxId, 6> indices)
    : indices_(indices) {
  nint_ = static_cast<std::size_t>(ranges::count_if(indices_, [&](IdxId id) {
    return arena[id].type == JType::Integer;
  }));
  if (nint_ != 2 && nint_ != 3 && nint_ != 6)
    throw InvariantViolation("SixJ: " + std::to_string(nint_) +
                             " integer entries do not form a valid 6j-symbol");
}

bool SixJ::contains(IdxId id) const { return position(id).has_value(); }

std::optional<std::size_t> SixJ::position(IdxId id) const {
  auto it = ranges::find(indices_, id);
  if (it == indices_.end()) return std::nullopt;
  return static_cast<std::size_t>(it - indices_.begin());
}

bool SixJ::contains(const TriangularDelta& tri) const {
  container::svector<std::size_t, 6> positions;
  for (std::size_t k = 0; k != 6; ++k) {
    for (auto id : tri.indices) {
      if (indices_[k] == id) positions.push_back(k);
    }
  }
  if (positions.size() != 3) return false;

  ranges::sort(positions);
  constexpr std::array<std::array<std::size_t, 3>, 4> triads{
      {{0, 1, 2}, {0, 4, 5}, {1, 3, 5}, {2, 3, 4}}};
  for (const auto& triad : triads) {
    if (std::equal(triad.begin(), triad.end(), positions.begin()))
      return true;
  }
  return false;
}

void SixJ::canonicalize(const IdxArena& arena) {
  auto is_int = [&](std::size_t k) {
    return arena[indices_[k]].type == JType::Integer;
  };
  auto& i = indices_;

  if (nint_ == 2) {
    // move the integer column to the right
    if (is_int(0)) i = {i[1], i[2], i[0], i[4], i[5], i[3]};
    if (is_int(1)) i = {i[0], i[2], i[1], i[3], i[5], i[4]};

    // non-particle index goes to the fifth position
    constexpr std::array<std::size_t, 4> slots{0, 1, 3, 4};
    for (std::size_t k = 0; k != slots.size(); ++k) {
      if (arena[i[slots[k]]].is_particle) continue;
      switch (k) {
        case 0:
          i = {i[4], i[3], i[2], i[1], i[0], i[5]};
          break;
        case 1:
          i = {i[3], i[4], i[2], i[0], i[1], i[5]};
          break;
        case 2:
          i = {i[1], i[0], i[2], i[4], i[3], i[5]};
          break;
        default:
          break;
      }
      break;
    }
  } else if (nint_ == 3) {
    container::svector<std::size_t, 3> half_integer_columns;
    for (std::size_t k = 0; k != 3; ++k) {
      if (!is_int(k)) half_integer_columns.push_back(k);
    }
    if (half_integer_columns.size() == 2) {
      swap_rows_in_columns(half_integer_columns[0], half_integer_columns[1]);
    } else if (!half_integer_columns.empty()) {
      throw InvariantViolation(
          "SixJ::canonicalize: not a valid 6j-symbol with 3 integer entries");
    }
  }
}

void SixJ::swap_columns(std::size_t col1, std::size_t col2) {
  if (col1 > 2 || col2 > 2)
    throw InvariantViolation("SixJ::swap_columns: invalid column");
  std::swap(indices_[col1], indices_[col2]);
  std::swap(indices_[col1 + 3], indices_[col2 + 3]);
}

void SixJ::swap_rows_in_columns(std::size_t col1, std::size_t col2) {
  if (col1 > 2 || col2 > 2)
    throw InvariantViolation("SixJ::swap_rows_in_columns: invalid column");
  std::swap(indices_[col1], indices_[col1 + 3]);
  std::swap(indices_[col2], indices_[col2 + 3]);
}

std::wstring SixJ::to_wstring(const IdxArena& arena) const {
  std::wstring result = L"SixJ(";
  for (std::size_t k = 0; k != 6; ++k) {
    if (k != 0) result += k == 3 ? L"; " : L" ";
    result += arena[indices_[k]].label;
  }
  return result + L")";
}

}  // namespace amc::yutsis
