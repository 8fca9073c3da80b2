#ifndef AMC_CORE_REDUCED_TERM_HPP
#define AMC_CORE_REDUCED_TERM_HPP

#include <AMC/core/container.hpp>
#include <AMC/core/index.hpp>
#include <AMC/core/rational.hpp>
#include <AMC/core/tensor.hpp>

#include <array>
#include <optional>
#include <string>

namespace amc {

/// \f$ \delta_{j_1 j_2} \f$
struct DeltaJ {
  Index first;
  Index second;

  std::wstring to_wstring() const;
};

/// @brief \f$ (-1)^{\mathrm{jphase} \cdot j + \mathrm{mphase} \cdot m}
/// \hat{j}^{\mathrm{hatpower}} \f$ with \f$ \hat{j} = \sqrt{2j+1} \f$
///
/// Phases are stored reduced: modulo 2 for integer indices, and modulo 2
/// (with the remainder moved into an overall sign) for half-integer indices.
/// Use make_hat_phase_factor() to build one.
struct HatPhaseFactor {
  Index index;
  int hatpower = 0;
  int jphase = 0;
  int mphase = 0;

  std::wstring to_wstring() const;
};

/// @brief folds the phases of @p index and multiplies the resulting sign into
/// @p sign
/// @return the factor, or nullopt if it is unity apart from the sign
std::optional<HatPhaseFactor> make_hat_phase_factor(const Index& index,
                                                    int hatpower, int jphase,
                                                    int mphase, int& sign);

/// triangle condition \f$ \{ j_1 j_2 j_3 \} \f$
struct TriangularDeltaJ {
  std::array<Index, 3> indices;

  std::wstring to_wstring() const;
};

/// \f$ \begin{Bmatrix} j_1 & j_2 & j_3 \\ j_4 & j_5 & j_6 \end{Bmatrix} \f$
struct SixJSymbol {
  std::array<Index, 6> indices;

  std::wstring to_wstring() const;
};

/// 9j-symbol, row-major
struct NineJSymbol {
  std::array<Index, 9> indices;

  std::wstring to_wstring() const;
};

/// 12j-symbol of the first kind, three rows of four
struct TwelveJFirstSymbol {
  std::array<Index, 12> indices;

  std::wstring to_wstring() const;
};

/// @brief one term of an equation in the coupled scheme
///
/// Represents
/// \f$ c \sum_{\mathrm{summation}} \prod \delta \prod d \prod h \prod \{\}
/// \prod 6j \prod 9j \prod 12j \prod v \f$,
/// where every overall sign has been absorbed into the prefactor.
struct ReducedTerm {
  rational prefactor = 1;
  container::vector<Index> summation;
  /// summation indices that the reduction pinned to another index
  container::map<Index, Index> constraints;
  container::vector<DeltaJ> deltas;
  /// diagonal tensors, passed through unchanged
  container::vector<Variable> diagonal_factors;
  container::vector<HatPhaseFactor> hat_factors;
  container::vector<TriangularDeltaJ> triangular_deltas;
  container::vector<SixJSymbol> sixjs;
  container::vector<NineJSymbol> ninejs;
  container::vector<TwelveJFirstSymbol> twelvejfirsts;
  container::vector<ReducedVariable> variables;

  std::wstring to_wstring() const;
};

struct ReducedEquation {
  ReducedVariable lhs;
  container::vector<ReducedTerm> terms;

  std::wstring to_wstring() const;
};

}  // namespace amc

#endif  // AMC_CORE_REDUCED_TERM_HPP
