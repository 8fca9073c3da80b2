#include <AMC/reduction/reduction.hpp>

#include <AMC/core/logger.hpp>
#include <AMC/core/wstring.hpp>
#include <AMC/yutsis/exception.hpp>
#include <AMC/yutsis/functions.hpp>
#include <AMC/yutsis/graph.hpp>

#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/find.hpp>

#include <format>
#include <initializer_list>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace amc {

using yutsis::ClebschGordan;
using yutsis::IdxArena;
using yutsis::IdxId;

Index IndexCounters::next(JType type) {
  if (type == JType::Integer)
    return Index(L"J" + std::to_wstring(integer++), type,
                 IndexClass::AngularMomentum);
  return Index(L"j" + std::to_wstring(half_integer++), type,
               IndexClass::AngularMomentum);
}

Index IndexCounters::next_rank(JType type) {
  return Index(L"λ" + std::to_wstring(rank++), type,
               IndexClass::AngularMomentum);
}

ReductionError::ReductionError(std::size_t term_number, std::wstring lhs,
                               std::wstring term, const std::string& reason)
    : Exception(std::format("amc::ReductionError: could not reduce term {} "
                            "({}) of the equation for {}: {}",
                            term_number, to_string(term), to_string(lhs),
                            reason)),
      term_number_(term_number),
      lhs_(std::move(lhs)),
      term_(std::move(term)) {}

container::vector<Index> generate_auxiliary_indices(const Variable& v,
                                                    IndexCounters& counters,
                                                    const Index& zero) {
  const auto& scheme = v.tensor().scheme();
  if (!scheme) return {zero};

  container::vector<Index> result;
  auto rec = [&](const CouplingScheme& s, auto&& self) -> Index {
    if (s.is_leaf()) return v.subscript(s.leaf());
    const auto i0 = self(s.left(), self);
    const auto i1 = self(s.right(), self);
    result.push_back(counters.next(coupled_type(i0, i1)));
    return result.back();
  };

  const auto s0 = rec(scheme->left(), rec);
  const auto s1 = rec(scheme->right(), rec);
  if (v.tensor().scalar())
    result.push_back(zero);
  else
    result.push_back(counters.next_rank(coupled_type(s0, s1)));
  return result;
}

CouplingNetwork variable_to_clebsches(
    IdxArena& arena, const Variable& v,
    const container::map<Index, IdxId>& index_map, WETConvention convention,
    bool lhs) {
  CouplingNetwork network;
  const auto& tensor = v.tensor();
  const auto& scheme = tensor.scheme();

  // a tensor without subscripts has rank zero
  if (!scheme) {
    network.aux.push_back(
        arena.make(JType::Integer, {.zero = true, .external = lhs}));
    return network;
  }

  struct Coupled {
    IdxId id;
    int sign;
  };

  auto leaf = [&](int slot) -> Coupled {
    const auto& index = v.subscript(slot);
    const auto it = index_map.find(index);
    if (it == index_map.end())
      throw std::invalid_argument(
          std::format("variable_to_clebsches: index {} of {} is neither "
                      "external nor summed over",
                      to_string(index.label()), to_string(v.to_wstring())));
    return {it->second, slot > 0 ? 1 : -1};
  };

  auto rec = [&](const CouplingScheme& s, auto&& self) -> Coupled {
    if (s.is_leaf()) return leaf(s.leaf());
    const auto s0 = self(s.left(), self);
    const auto s1 = self(s.right(), self);
    const auto coupled =
        arena.make(arena.coupled_type(s0.id, s1.id), {.external = lhs});
    network.clebsches.push_back(
        ClebschGordan{{s0.id, s1.id, coupled}, {s0.sign, s1.sign, 1}});
    network.aux.push_back(coupled);
    // coupling the time-reversed state adds (-1)^{j-m}; the top coupling
    // keeps the bare sign in its Clebsch-Gordan coefficient
    for (const auto& c : {s0, s1}) {
      if (c.sign < 0) {
        arena[c.id].jphase += 1;
        arena[c.id].mphase -= 1;
      }
    }
    return {coupled, 1};
  };

  const auto s0 = rec(scheme->left(), rec);
  const auto s1 = rec(scheme->right(), rec);

  const auto rank = arena.make(
      arena.coupled_type(s0.id, s1.id),
      {.zero = tensor.scalar(), .external = lhs, .rank = true});

  if (tensor.reduce()) {
    switch (convention) {
      case WETConvention::Wigner:
        arena[rank].jphase += 2;
        arena[s0.id].jhat -= 1;
        break;
      case WETConvention::Sakurai:
        arena[s1.id].jhat -= 1;
        break;
    }
  }

  // cancels the unrestricted sum over the projection of an unreduced scalar
  if (lhs && tensor.scalar() && !tensor.reduce()) arena[s1.id].jhat -= 2;

  network.clebsches.push_back(
      ClebschGordan{{s1.id, rank, s0.id}, {s1.sign, 1, s0.sign}});
  network.aux.push_back(rank);
  return network;
}

void auxiliary_indices_to_named(const IdxArena& arena,
                                const container::vector<IdxId>& aux,
                                container::map<IdxId, Index>& subscript_map,
                                IndexCounters& counters, const Index& zero) {
  auto new_name = [&](IdxId id) -> Index {
    const auto& idx = arena[id];
    if (idx.zero) return zero;
    return idx.rank ? counters.next_rank(idx.type) : counters.next(idx.type);
  };

  for (auto id : aux) {
    if (subscript_map.contains(id)) continue;
    const auto survivor = arena.root(id);
    if (survivor == id) {
      subscript_map.emplace(id, new_name(id));
      continue;
    }
    if (!subscript_map.contains(survivor))
      subscript_map.emplace(survivor, new_name(survivor));
    auto name = subscript_map.at(survivor);
    subscript_map.emplace(id, std::move(name));
  }
}

namespace {

/// accumulated factors of all indices that share one name
struct Accumulator {
  int hatpower = 0;
  int jphase = 0;
  int mphase = 0;
  int sign = 1;
};

void push_unique(container::vector<Index>& indices, const Index& index) {
  if (ranges::find(indices, index) == indices.end()) indices.push_back(index);
}

}  // namespace

ReducedTerm reduce_term(const Variable& lhs,
                        const container::vector<Index>& aux_lhs,
                        const Term& term, IndexCounters counters,
                        const Index& zero, const Context& ctx) {
  const auto& logger = Logger::instance();
  if (logger.reduce_term)
    std::wcout << L"reducing term " << term.to_wstring() << std::endl;

  ReducedTerm result;
  result.prefactor = term.prefactor;

  container::vector<Variable> variables;
  for (const auto& v : term.factors) {
    if (v.tensor().diagonal())
      result.diagonal_factors.push_back(v);
    else
      variables.push_back(v);
  }
  if (variables.empty())
    throw std::invalid_argument(
        std::format("reduce_term: term {} has no coupled tensor",
                    to_string(term.to_wstring())));

  IdxArena arena;

  // external indices in the order of appearance on the left-hand side
  container::vector<std::pair<Index, IdxId>> external;
  container::map<Index, IdxId> external_map;
  for (const auto& index : lhs.subscripts()) {
    if (external_map.contains(index)) continue;
    const auto id = arena.make(index.type(), index.label(),
                               {.is_particle = index.is_particle(),
                                .external = true});
    external.emplace_back(index, id);
    external_map.emplace(index, id);
  }

  container::map<Index, IdxId> internal_map;
  for (const auto& index : term.summation) {
    if (internal_map.contains(index)) continue;
    if (external_map.contains(index))
      throw std::invalid_argument(
          std::format("reduce_term: summation index {} is also external",
                      to_string(index.label())));
    internal_map.emplace(index, arena.make(index.type(), index.label(),
                                           {.is_particle = index.is_particle()}));
  }
  const auto zero_id =
      arena.make(JType::Integer, zero.label(), {.zero = true});
  internal_map.insert_or_assign(zero, zero_id);

  container::map<Index, IdxId> index_map = internal_map;
  for (const auto& [index, id] : external_map) index_map.emplace(index, id);

  container::vector<ClebschGordan> clebsches;
  // coupled angular momenta of the right-hand side, summed over
  container::vector<IdxId> summed;
  container::vector<container::vector<IdxId>> variable_aux;
  for (const auto& v : variables) {
    auto network =
        variable_to_clebsches(arena, v, index_map, ctx.convention(), false);
    clebsches.insert(clebsches.end(), network.clebsches.begin(),
                     network.clebsches.end());
    summed.insert(summed.end(), network.aux.begin(), network.aux.end());
    variable_aux.push_back(std::move(network.aux));
  }

  auto lhs_network =
      variable_to_clebsches(arena, lhs, external_map, ctx.convention(), true);
  if (lhs_network.aux.size() != aux_lhs.size())
    throw std::invalid_argument(
        std::format("reduce_term: expected {} coupling labels for {}, got {}",
                    lhs_network.aux.size(), to_string(lhs.to_wstring()),
                    aux_lhs.size()));
  for (std::size_t k = 0; k != aux_lhs.size(); ++k)
    external.emplace_back(aux_lhs[k], lhs_network.aux[k]);
  clebsches.insert(clebsches.end(), lhs_network.clebsches.begin(),
                   lhs_network.clebsches.end());

  // couple the tensor ranks of the right-hand side to the rank of the
  // left-hand side
  const auto rank_lhs = lhs_network.aux.back();
  if (variable_aux.size() == 1) {
    const auto rank = variable_aux.front().back();
    if (!arena[rank].zero)
      clebsches.push_back(ClebschGordan{{rank, zero_id, rank_lhs}});
  } else {
    auto left = variable_aux.front().back();
    for (std::size_t k = 1; k != variable_aux.size(); ++k) {
      const auto rank = variable_aux[k].back();
      if (arena[left].zero && arena[rank].zero) {
        left = zero_id;
        continue;
      }
      IdxId coupled = rank_lhs;
      if (k + 1 != variable_aux.size()) {
        coupled = arena.make(arena.coupled_type(left, rank));
        summed.push_back(coupled);
      }
      clebsches.push_back(ClebschGordan{{left, rank, coupled}});
      left = coupled;
    }
  }

  if (logger.reduce_term) {
    std::wcout << L"Clebsch-Gordan network:" << std::endl;
    for (const auto& cg : clebsches)
      std::wcout << L"  " << cg.to_wstring(arena) << std::endl;
  }

  auto graph = yutsis::yutsis_reduction(arena, clebsches, zero_id, ctx);

  // every index of a symbol that is neither external nor named is a new
  // summation index, e.g. the one introduced by reducing a square
  container::set<IdxId> known;
  for (const auto& [index, id] : external) known.insert(id);
  for (const auto& [index, id] : internal_map) known.insert(id);
  known.insert(summed.begin(), summed.end());
  auto note = [&](IdxId id) {
    if (known.contains(id)) return;
    known.insert(id);
    summed.push_back(id);
  };
  for (auto& sixj : graph.sixjs()) {
    sixj.canonicalize(arena);
    for (auto id : sixj.indices()) note(id);
  }
  for (const auto& ninej : graph.ninejs())
    for (auto id : ninej.indices()) note(id);
  for (const auto& twelvej : graph.twelvejfirsts())
    for (auto id : twelvej.indices) note(id);
  for (const auto& tri : graph.triangular_deltas())
    for (auto id : tri.indices) note(id);

  yutsis::handle_deltas(graph);

  container::map<IdxId, Index> subscript_map;
  for (const auto& [index, id] : external) subscript_map.emplace(id, index);
  for (const auto& [index, id] : internal_map)
    subscript_map.emplace(id, index);

  auxiliary_indices_to_named(arena, summed, subscript_map, counters, zero);

  auto name_of = [&](IdxId id) -> const Index& {
    auto it = subscript_map.find(id);
    if (it == subscript_map.end()) it = subscript_map.find(arena.root(id));
    if (it == subscript_map.end())
      throw InvariantViolation(std::format(
          "reduce_term: index {} has no name",
          to_string(arena[id].label)));
    return it->second;
  };

  // constraints of summation indices
  for (const auto& [index, id] : internal_map) {
    if (index == zero || !arena[id].constrained_to) continue;
    const auto& survivor = name_of(*arena[id].constrained_to);
    if (survivor != index) result.constraints.emplace(index, survivor);
  }

  // deltas between external indices
  for (const auto& [index, id] : external) {
    if (!arena[id].constrained_to) continue;
    const auto& survivor = name_of(*arena[id].constrained_to);
    if (survivor != index) result.deltas.push_back(DeltaJ{index, survivor});
  }

  // hat and phase factors of all unconstrained indices, by name
  container::map<Index, Accumulator> accumulators;
  for (const auto& [id, index] : subscript_map) {
    const auto& idx = arena[id];
    if (idx.constrained_to) continue;
    auto& acc = accumulators[index];
    acc.hatpower += idx.jhat;
    acc.jphase += idx.jphase;
    acc.mphase += idx.mphase;
    acc.sign *= idx.sign;
  }
  int sign = graph.sign();
  for (const auto& [index, acc] : accumulators) {
    sign *= acc.sign;
    // (-1)^{0} = 1 = hat(0)
    if (index == zero) continue;
    auto factor = make_hat_phase_factor(index, acc.hatpower, acc.jphase,
                                        acc.mphase, sign);
    if (factor) result.hat_factors.push_back(std::move(*factor));
  }
  result.prefactor *= sign;

  for (const auto& tri : graph.triangular_deltas())
    result.triangular_deltas.push_back(TriangularDeltaJ{
        {name_of(tri.indices[0]), name_of(tri.indices[1]),
         name_of(tri.indices[2])}});
  for (const auto& sixj : graph.sixjs()) {
    const auto& i = sixj.indices();
    result.sixjs.push_back(SixJSymbol{{name_of(i[0]), name_of(i[1]),
                                       name_of(i[2]), name_of(i[3]),
                                       name_of(i[4]), name_of(i[5])}});
  }
  for (const auto& ninej : graph.ninejs()) {
    const auto& i = ninej.indices();
    result.ninejs.push_back(NineJSymbol{
        {name_of(i[0]), name_of(i[1]), name_of(i[2]), name_of(i[3]),
         name_of(i[4]), name_of(i[5]), name_of(i[6]), name_of(i[7]),
         name_of(i[8])}});
  }
  for (const auto& twelvej : graph.twelvejfirsts()) {
    const auto& i = twelvej.indices;
    result.twelvejfirsts.push_back(TwelveJFirstSymbol{
        {name_of(i[0]), name_of(i[1]), name_of(i[2]), name_of(i[3]),
         name_of(i[4]), name_of(i[5]), name_of(i[6]), name_of(i[7]),
         name_of(i[8]), name_of(i[9]), name_of(i[10]), name_of(i[11])}});
  }

  for (std::size_t k = 0; k != variables.size(); ++k) {
    container::vector<Index> labels;
    for (auto id : variable_aux[k]) labels.push_back(name_of(id));
    result.variables.emplace_back(variables[k], std::move(labels));
  }

  // summation: the term's own indices, then the new coupled angular momenta
  for (const auto& index : term.summation) push_unique(result.summation, index);
  for (auto id : summed) {
    const auto& index = name_of(id);
    const bool is_external = ranges::any_of(
        external, [&index](const auto& e) { return e.first == index; });
    if (index == zero || is_external) continue;
    push_unique(result.summation, index);
  }

  if (logger.reduce_term)
    std::wcout << L"reduced term: " << result.to_wstring() << std::endl;

  return result;
}

ReducedEquation reduce_equation(const Equation& equation,
                                const Context& ctx) {
  const auto& logger = Logger::instance();
  if (logger.reduce_equation)
    std::wcout << L"reducing equation " << equation.to_wstring() << std::endl;

  IndexCounters counters;
  const Index zero(L"0", JType::Integer, IndexClass::AngularMomentum);
  const auto aux_lhs =
      generate_auxiliary_indices(equation.lhs, counters, zero);

  ReducedEquation result{ReducedVariable(equation.lhs, aux_lhs), {}};
  for (std::size_t t = 0; t != equation.terms.size(); ++t) {
    if (logger.reduce_equation)
      std::wcout << L"term " << t + 1 << L"/" << equation.terms.size()
                 << std::endl;
    try {
      result.terms.push_back(reduce_term(equation.lhs, aux_lhs,
                                         equation.terms[t], counters, zero,
                                         ctx));
    } catch (const GraphNotReducible& e) {
      throw ReductionError(t, equation.lhs.to_wstring(),
                           equation.terms[t].to_wstring(), e.what());
    }
  }
  return result;
}

}  // namespace amc
