#ifndef AMC_CORE_TERM_HPP
#define AMC_CORE_TERM_HPP

#include <AMC/core/container.hpp>
#include <AMC/core/index.hpp>
#include <AMC/core/rational.hpp>
#include <AMC/core/tensor.hpp>

#include <string>

namespace amc {

/// @brief \f$ c \sum_{i_1 i_2 \ldots} \prod_k v_k \f$ in the uncoupled
/// scheme
struct Term {
  rational prefactor = 1;
  container::vector<Index> summation;
  container::vector<Variable> factors;

  std::wstring to_wstring() const;
};

/// @brief an equation in the uncoupled scheme, with the right-hand side
/// expanded to a flat sum of terms
struct Equation {
  Variable lhs;
  container::vector<Term> terms;

  std::wstring to_wstring() const;
};

namespace detail {

/// `sum_{a b} ` for a nonempty @p summation, an empty string otherwise
std::wstring summation_to_wstring(const container::vector<Index>& summation);

}  // namespace detail

}  // namespace amc

#endif  // AMC_CORE_TERM_HPP
