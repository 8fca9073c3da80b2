#ifndef AMC_YUTSIS_NINEJ_HPP
#define AMC_YUTSIS_NINEJ_HPP

#include <AMC/yutsis/idx.hpp>

#include <array>
#include <cstddef>
#include <string>

namespace amc::yutsis {

/// @brief 9j-symbol
/// \f$ \begin{Bmatrix} j_1 & j_2 & j_3 \\ j_4 & j_5 & j_6 \\ j_7 & j_8 & j_9
/// \end{Bmatrix} \f$, stored row-major
///
/// An odd permutation of rows or columns multiplies the symbol by
/// \f$ (-1)^{\sum_k j_k} \f$; reflections about either diagonal leave it
/// unchanged.
class NineJ {
 public:
  /// stores the indices and, if exactly three of them are integers, brings
  /// them to positions 6, 4 and 2 (in order of appearance)
  NineJ(IdxArena& arena, std::array<IdxId, 9> indices);

  const std::array<IdxId, 9>& indices() const { return indices_; }

  bool contains(IdxId id) const;

  /// moves @p id to position @p pos by at most one column and one row swap
  void place_index(IdxId id, std::size_t pos, IdxArena& arena);

  void swap_columns(std::size_t col1, std::size_t col2, IdxArena& arena);
  void swap_rows(std::size_t row1, std::size_t row2, IdxArena& arena);

  void reflect_main_diagonal();
  void reflect_anti_diagonal();

  std::wstring to_wstring(const IdxArena& arena) const;

 private:
  std::array<IdxId, 9> indices_;

  void canonicalize(IdxArena& arena);
  void add_permutation_phase(IdxArena& arena) const;
};

}  // namespace amc::yutsis

#endif  // AMC_YUTSIS_NINEJ_HPP
