#ifndef AMC_YUTSIS_FUNCTIONS_HPP
#define AMC_YUTSIS_FUNCTIONS_HPP

#include <AMC/yutsis/delta.hpp>
#include <AMC/yutsis/graph.hpp>
#include <AMC/yutsis/idx.hpp>
#include <AMC/yutsis/threejm.hpp>

#include <AMC/core/container.hpp>
#include <AMC/core/context.hpp>

#include <cstddef>

namespace amc::yutsis {

/// @brief eliminates the 3JM-symbols that carry a zero line
///
/// Applies, until nothing changes, the rules
/// 1. \f$ (j\, j\, x) \f$: x is a zero line, recorded as a delta with @p zero;
/// 2. \f$ (j_1\, j_2\, 0) = \delta_{j_1 j_2} (-1)^{j_1 - m_1} / \hat{j_1} \f$:
///    the symbol is replaced by a delta;
/// 3. \f$ \sum_m (-1)^{j - m} (j\, j\, 0) = \hat{j} \f$: the symbol is
///    dropped.
/// @throw InvariantViolation if a symbol cannot be handled, a zero line
/// survives, or @p max_iterations sweeps do not reach the fixed point
void handle_zero_lines(IdxArena& arena, container::vector<ThreeJM>& threejms,
                       container::vector<Delta>& deltas, IdxId zero,
                       std::size_t max_iterations =
                           Context::Defaults::max_zero_line_iterations);

/// @brief flips projection signs so that every index appears with opposite
/// signs in its two 3JM-symbols
/// @throw InvariantViolation if an index does not appear exactly twice or the
/// signs cannot be made consistent
void canonicalize(IdxArena& arena, container::vector<ThreeJM>& threejms);

/// @brief resolves chains of deltas
///
/// Every group of deltas connected through shared indices keeps one
/// surviving index (preferring zero, then external, then particle indices,
/// then short labels); all other indices of the group are constrained to it
/// and hand over their accumulated factors. @p deltas is emptied.
/// @return the map from every constrained index to its survivor
container::map<IdxId, IdxId> handle_deltas(IdxArena& arena,
                                           container::vector<Delta>& deltas);

/// resolves the deltas of @p graph
container::map<IdxId, IdxId> handle_deltas(YutsisGraph& graph);

/// @brief reduces a closed network of Clebsch-Gordan coefficients
///
/// Converts @p clebsches to 3JM-symbols, eliminates zero lines, fixes the
/// projection signs, builds the Yutsis graph, separates single internal
/// lines, reduces every connected component and merges the results.
/// 9j- and 12j-symbols are collected if @p ctx asks for it.
/// @throw GraphNotReducible if a component cannot be reduced
YutsisGraph yutsis_reduction(IdxArena& arena,
                             const container::vector<ClebschGordan>& clebsches,
                             IdxId zero,
                             const Context& ctx = get_default_context());

}  // namespace amc::yutsis

#endif  // AMC_YUTSIS_FUNCTIONS_HPP
