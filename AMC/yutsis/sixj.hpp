#ifndef AMC_YUTSIS_SIXJ_HPP
#define AMC_YUTSIS_SIXJ_HPP

#include <AMC/yutsis/idx.hpp>
#include <AMC/yutsis/triangular_delta.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace amc::yutsis {

/// @brief 6j-symbol
/// \f$ \begin{Bmatrix} j_1 & j_2 & j_3 \\ j_4 & j_5 & j_6 \end{Bmatrix} \f$,
/// stored row-major
///
/// Its triads are (0,1,2), (0,4,5), (1,3,5) and (2,3,4). The symbol is
/// invariant under column permutations and under the exchange of upper and
/// lower entries in any two columns, so none of the operations below adds a
/// phase.
class SixJ {
 public:
  /// @throw InvariantViolation unless 2, 3 or 6 of the indices are integers
  SixJ(const IdxArena& arena, std::array<IdxId, 6> indices);

  const std::array<IdxId, 6>& indices() const { return indices_; }
  std::size_t nint() const { return nint_; }

  bool contains(IdxId id) const;

  /// @return the position of @p id, if present
  std::optional<std::size_t> position(IdxId id) const;

  /// @return true if the three indices of @p tri form one of the triads
  bool contains(const TriangularDelta& tri) const;

  /// brings the symbol to the canonical type pattern for its number of
  /// integer entries (h = half-integer, i = integer):
  /// {h h i / h h i}, {i i i / h h h} or {i i i / i i i}; with two integer
  /// entries a non-particle index is moved to the fifth position
  void canonicalize(const IdxArena& arena);

  void swap_columns(std::size_t col1, std::size_t col2);

  /// exchanges upper and lower entries in columns @p col1 and @p col2
  void swap_rows_in_columns(std::size_t col1, std::size_t col2);

  std::wstring to_wstring(const IdxArena& arena) const;

 private:
  std::array<IdxId, 6> indices_;
  std::size_t nint_ = 0;
};

}  // namespace amc::yutsis

#endif  // AMC_YUTSIS_SIXJ_HPP
