#ifndef AMC_YUTSIS_THREEJM_HPP
#define AMC_YUTSIS_THREEJM_HPP

#include <AMC/yutsis/idx.hpp>

#include <array>
#include <cstddef>
#include <string>

namespace amc::yutsis {

class ThreeJM;

/// @brief Clebsch-Gordan coefficient
/// \f$ C^{j_3, s_3 m_3}_{j_1, s_1 m_1; j_2, s_2 m_2} \f$, where the signs
/// \f$ s_k = \pm 1 \f$ of the projections are stored alongside the indices
struct ClebschGordan {
  std::array<IdxId, 3> indices;
  std::array<int, 3> signs = {1, 1, 1};

  /// @brief converts to a 3JM-symbol,
  /// \f$ C^{j_3 m_3}_{j_1 m_1 j_2 m_2} = (-1)^{j_1 - j_2 + m_3} \hat{j_3}
  /// \begin{pmatrix} j_1 & j_2 & j_3 \\ m_1 & m_2 & -m_3 \end{pmatrix} \f$;
  /// the factors are accumulated on the indices in @p arena
  ThreeJM to_threejm(IdxArena& arena) const;

  std::wstring to_wstring(const IdxArena& arena) const;
};

/// @brief 3JM-symbol with signed projections
///
/// A negative projection \f$ -m \f$ is always accompanied by a phase
/// \f$ (-1)^{j-m} \f$, which makes the symbol invariant under cyclic
/// permutations and lets sign flips be expressed as phase shifts on j only.
class ThreeJM {
 public:
  /// wraps the indices and signs as is, without any phase
  ThreeJM(std::array<IdxId, 3> indices, std::array<int, 3> signs);

  const std::array<IdxId, 3>& indices() const { return indices_; }
  const std::array<int, 3>& signs() const { return signs_; }
  IdxId idx(std::size_t k) const { return indices_.at(k); }
  int sign(std::size_t k) const { return signs_.at(k); }

  void set_idx(std::size_t k, IdxId id) { indices_.at(k) = id; }
  void set_sign(std::size_t k, int sign) { signs_.at(k) = sign; }

  /// @return the number of slots occupied by @p id
  std::size_t count(IdxId id) const;

  /// swaps slots @p k1 and @p k2 (index and sign), adding
  /// \f$ (-1)^{j_1 + j_2 + j_3} \f$; does nothing if @p k1 == @p k2
  void exchange(std::size_t k1, std::size_t k2, IdxArena& arena);

  /// negates all three signs, adding \f$ (-1)^{2j} \f$ for every slot whose
  /// sign becomes positive
  void flip_signs(IdxArena& arena);

  std::wstring to_wstring(const IdxArena& arena) const;

 private:
  std::array<IdxId, 3> indices_;
  std::array<int, 3> signs_;
};

}  // namespace amc::yutsis

#endif  // AMC_YUTSIS_THREEJM_HPP
