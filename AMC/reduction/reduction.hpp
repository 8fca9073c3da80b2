#ifndef AMC_REDUCTION_REDUCTION_HPP
#define AMC_REDUCTION_REDUCTION_HPP

#include <AMC/core/container.hpp>
#include <AMC/core/context.hpp>
#include <AMC/core/index.hpp>
#include <AMC/core/reduced_term.hpp>
#include <AMC/core/tensor.hpp>
#include <AMC/core/term.hpp>
#include <AMC/core/utility/exception.hpp>
#include <AMC/yutsis/idx.hpp>
#include <AMC/yutsis/threejm.hpp>

#include <cstddef>
#include <string>

namespace amc {

/// @brief counters for generated labels: `J<n>` (integer), `j<n>`
/// (half-integer) and `λ<n>` (tensor ranks)
///
/// One set of counters is shared by the left-hand side of an equation and
/// copied for every term, so that labels generated for a term never alias
/// the labels of the left-hand side.
struct IndexCounters {
  std::size_t integer = 0;
  std::size_t half_integer = 0;
  std::size_t rank = 0;

  /// @return a new angular-momentum index of type @p type
  Index next(JType type);

  /// @return a new rank index of type @p type
  Index next_rank(JType type);
};

/// @brief thrown by reduce_equation() when a term cannot be reduced
class ReductionError : public Exception {
 public:
  ReductionError(std::size_t term_number, std::wstring lhs, std::wstring term,
                 const std::string& reason);

  /// zero-based position of the offending term
  std::size_t term_number() const { return term_number_; }
  const std::wstring& lhs() const { return lhs_; }
  const std::wstring& term() const { return term_; }

 private:
  std::size_t term_number_;
  std::wstring lhs_;
  std::wstring term_;
};

/// @brief the Clebsch-Gordan network of one tensor variable
struct CouplingNetwork {
  container::vector<yutsis::ClebschGordan> clebsches;
  /// the coupled angular momenta, one per coupling of the scheme in
  /// post-order; the last one is the rank
  container::vector<yutsis::IdxId> aux;
};

/// @brief labels of the coupled angular momenta of @p v, in the order of
/// CouplingNetwork::aux
///
/// The rank label of a scalar tensor, and the only label of a tensor without
/// coupling scheme, is @p zero.
container::vector<Index> generate_auxiliary_indices(const Variable& v,
                                                    IndexCounters& counters,
                                                    const Index& zero);

/// @brief expands the coupling scheme of @p v into Clebsch-Gordan
/// coefficients
///
/// Every coupling creates a new index in @p arena. The factors relating
/// reduced and unreduced matrix elements in @p convention are accumulated on
/// the indices.
/// @param index_map maps the subscripts of @p v to indices of @p arena
/// @param lhs set if @p v is the left-hand side of an equation; its coupled
/// indices are external, and an unreduced scalar gets the hat factors that
/// cancel the free sum over the total projection
CouplingNetwork variable_to_clebsches(
    yutsis::IdxArena& arena, const Variable& v,
    const container::map<Index, yutsis::IdxId>& index_map,
    WETConvention convention, bool lhs);

/// @brief names the indices in @p aux that @p subscript_map does not know yet
///
/// An unconstrained index gets a new label from @p counters, or @p zero if it
/// is a zero line. A constrained index gets the label of its survivor, which
/// is named first if necessary.
void auxiliary_indices_to_named(
    const yutsis::IdxArena& arena, const container::vector<yutsis::IdxId>& aux,
    container::map<yutsis::IdxId, Index>& subscript_map,
    IndexCounters& counters, const Index& zero);

/// @brief reduces one term to the coupled scheme
///
/// Builds the Clebsch-Gordan network of the left-hand side @p lhs and of
/// every nondiagonal variable of @p term, couples the tensor ranks, reduces
/// the network and translates the result back to named indices.
/// @param aux_lhs labels of the coupled angular momenta of @p lhs, see
/// generate_auxiliary_indices()
/// @param counters label counters, advanced past @p aux_lhs
/// @throw GraphNotReducible if the Yutsis graph cannot be reduced
/// @throw std::invalid_argument if @p term has no nondiagonal variable
ReducedTerm reduce_term(const Variable& lhs,
                        const container::vector<Index>& aux_lhs,
                        const Term& term, IndexCounters counters,
                        const Index& zero,
                        const Context& ctx = get_default_context());

/// @brief reduces every term of @p equation
/// @throw ReductionError if a term cannot be reduced
ReducedEquation reduce_equation(const Equation& equation,
                                const Context& ctx = get_default_context());

}  // namespace amc

#endif  // AMC_REDUCTION_REDUCTION_HPP
