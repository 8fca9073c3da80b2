#include <AMC/yutsis/graph.hpp>

#include <AMC/yutsis/exception.hpp>

#include <AMC/core/logger.hpp>
#include <AMC/core/wstring.hpp>

#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/find.hpp>
#include <range/v3/algorithm/remove_if.hpp>
#include <range/v3/algorithm/sort.hpp>
#include <range/v3/functional/comparisons.hpp>

#include <format>
#include <iostream>
#include <string>
#include <utility>

namespace amc::yutsis {

YutsisGraph::YutsisGraph(IdxArena& arena, IdxId zero)
    : arena_(&arena), zero_(zero) {}

YutsisGraph::YutsisGraph(IdxArena& arena,
                         const container::vector<ThreeJM>& threejms,
                         container::vector<Delta> deltas, IdxId zero)
    : arena_(&arena),
      zero_(zero),
      n_(threejms.size() / 2),
      deltas_(std::move(deltas)) {
  if (threejms.size() % 2 != 0)
    throw InvariantViolation(
        "YutsisGraph: a closed string needs an even number of 3JM-symbols, "
        "got " +
        std::to_string(threejms.size()));

  container::map<IdxId, EdgeId> edge_of;
  for (NodeId k = 0; k != threejms.size(); ++k) {
    const auto& threejm = threejms[k];
    node_pool_.emplace_back();
    nodes_.push_back(k);

    for (std::size_t l = 0; l != 3; ++l) {
      const auto id = threejm.idx(l);
      auto it = edge_of.find(id);
      const EdgeId e = it != edge_of.end() ? it->second : add_edge(id);
      if (it == edge_of.end()) edge_of.emplace(id, e);

      auto& edge = edge_ref(e);
      if (threejm.sign(l) == 1) {
        if (edge.outgoing() != null_node)
          throw InvariantViolation("YutsisGraph: index " +
                                   to_string(arena[id].label) +
                                   " has two positive projections");
        edge.set_outgoing(k);
      } else {
        if (edge.incoming() != null_node)
          throw InvariantViolation("YutsisGraph: index " +
                                   to_string(arena[id].label) +
                                   " has two negative projections");
        edge.set_incoming(k);
      }
      node_ref(k).set_edge(l, e);
    }
  }

  for (auto e : edges_) {
    if (edge(e).outgoing() == null_node || edge(e).incoming() == null_node)
      throw InvariantViolation("YutsisGraph: index " +
                               to_string(arena[idx_of(e)].label) +
                               " appears in a single 3JM-symbol");
  }

  if (Logger::instance().yutsis_graph) std::wcout << to_wstring();
}

EdgeId YutsisGraph::add_edge(IdxId idx) {
  edge_pool_.emplace_back(idx);
  edges_.push_back(edge_pool_.size() - 1);
  return edges_.back();
}

void YutsisGraph::remove_node(NodeId id) {
  auto it = ranges::find(nodes_, id);
  if (it == nodes_.end())
    throw InvariantViolation("YutsisGraph: removing a node twice");
  nodes_.erase(it);
}

void YutsisGraph::remove_edge(EdgeId id) {
  auto it = ranges::find(edges_, id);
  if (it == edges_.end())
    throw InvariantViolation("YutsisGraph: removing an edge twice");
  edges_.erase(it);
}

container::svector<EdgeId, 3> YutsisGraph::common_edges(NodeId a,
                                                        NodeId b) const {
  container::svector<EdgeId, 3> result;
  for (auto e : node(a).edges()) {
    if (node(b).has(e)) result.push_back(e);
  }
  return result;
}

NodeId YutsisGraph::common_node(EdgeId a, EdgeId b) const {
  for (auto node_a : edge(a).nodes()) {
    if (edge(b).touches(node_a)) return node_a;
  }
  throw InvariantViolation("YutsisGraph: edges " +
                           to_string((*arena_)[idx_of(a)].label) +
                           " and " + to_string((*arena_)[idx_of(b)].label) +
                           " are not adjacent");
}

EdgeId YutsisGraph::external_edge(NodeId node_id,
                                  std::initializer_list<EdgeId> internal) const {
  for (auto e : node(node_id).edges()) {
    if (ranges::find(internal, e) == internal.end()) return e;
  }
  throw InvariantViolation("YutsisGraph: node has no external edge");
}

container::vector<NodeId> YutsisGraph::connected_nodes(
    NodeId start, std::optional<EdgeId> excluded) const {
  container::vector<NodeId> result{start};
  container::set<EdgeId> visited;
  for (std::size_t i = 0; i != result.size(); ++i) {
    for (auto e : node(result[i]).edges()) {
      if (e == excluded || !visited.insert(e).second) continue;
      for (auto other : edge(e).nodes()) {
        if (ranges::find(result, other) == result.end())
          result.push_back(other);
      }
    }
  }
  return result;
}

void YutsisGraph::make_outgoing(EdgeId e, NodeId node_id) {
  auto& edge = edge_ref(e);
  if (edge.outgoing() == node_id) return;
  if (edge.incoming() != node_id)
    throw InvariantViolation("YutsisGraph: edge " +
                             to_string((*arena_)[edge.idx()].label) +
                             " is neither incoming nor outgoing");
  edge.change_direction(*arena_);
}

void YutsisGraph::make_incoming(EdgeId e, NodeId node_id) {
  auto& edge = edge_ref(e);
  if (edge.incoming() == node_id) return;
  if (edge.outgoing() != node_id)
    throw InvariantViolation("YutsisGraph: edge " +
                             to_string((*arena_)[edge.idx()].label) +
                             " is neither incoming nor outgoing");
  edge.change_direction(*arena_);
}

void YutsisGraph::change_sign(NodeId node_id, SignChange kind) {
  auto& node = node_ref(node_id);
  node.set_sign(-node.sign());
  if (kind == SignChange::Direct) {
    for (auto e : node.edges()) (*arena_)[idx_of(e)].jphase += 1;
  }
}

void YutsisGraph::merge_edges(EdgeId outgoing_edge, EdgeId incoming_edge) {
  const auto origin = edge(incoming_edge).outgoing();
  edge_ref(outgoing_edge).set_outgoing(origin);
  auto& node = node_ref(origin);
  node.place_first(incoming_edge);
  node.set_edge(0, outgoing_edge);
  remove_edge(incoming_edge);
}

void YutsisGraph::separate() {
  bool separated = true;
  while (separated) {
    separated = false;
    for (auto e : edges_) {
      if (connected_nodes(edge(e).outgoing(), e).size() % 2 != 0) {
        separate_single_internal_line(e);
        separated = true;
        break;
      }
    }
  }
}

void YutsisGraph::separate_single_internal_line(EdgeId e) {
  const auto node1 = edge(e).outgoing();
  const auto node2 = edge(e).incoming();
  if (node1 == node2)
    throw InvariantViolation(
        "YutsisGraph::separate: single internal line closes on itself");

  auto externals = [&](NodeId node_id) {
    container::svector<EdgeId, 2> result;
    for (auto ee : node(node_id).edges()) {
      if (ee != e) result.push_back(ee);
    }
    if (result.size() != 2 || result[0] == result[1])
      throw InvariantViolation(
          "YutsisGraph::separate: one side of a single internal line is a "
          "one-cycle");
    return result;
  };
  const auto ext1 = externals(node1);
  const auto ext2 = externals(node2);

  if (Logger::instance().separation)
    std::wcout << L"separating single internal line "
               << (*arena_)[idx_of(e)].label << std::endl;

  make_incoming(ext1[0], node1);
  make_outgoing(ext1[1], node1);
  make_incoming(ext2[0], node2);
  make_outgoing(ext2[1], node2);

  if (node(node1).first_of_two(ext1[0], ext1[1]) == ext1[0])
    change_sign(node1, SignChange::Direct);
  if (node(node2).first_of_two(ext2[0], ext2[1]) == ext2[0])
    change_sign(node2, SignChange::Direct);

  (*arena_)[idx_of(ext1[0])].jhat -= 1;
  (*arena_)[idx_of(ext2[0])].jhat -= 1;

  deltas_.emplace_back(*arena_, idx_of(ext1[0]), idx_of(ext1[1]));
  deltas_.emplace_back(*arena_, idx_of(ext2[0]), idx_of(ext2[1]));
  deltas_.emplace_back(*arena_, zero_, idx_of(e));

  n_ -= 1;
  remove_edge(e);
  remove_node(node1);
  remove_node(node2);
  merge_edges(ext1[1], ext1[0]);
  merge_edges(ext2[1], ext2[0]);
}

container::vector<YutsisGraph> YutsisGraph::disconnected_graphs() const {
  if (nodes_.empty()) return {*this};

  container::vector<YutsisGraph> result;
  container::set<NodeId> assigned;
  for (auto start : nodes_) {
    if (assigned.contains(start)) continue;
    const auto reached = connected_nodes(start);
    if (result.empty() && reached.size() == nodes_.size()) return {*this};
    assigned.insert(reached.begin(), reached.end());
    const container::set<NodeId> component(reached.begin(), reached.end());

    YutsisGraph g(*arena_, zero_);
    container::map<NodeId, NodeId> node_map;
    container::map<EdgeId, EdgeId> edge_map;
    for (auto nd : nodes_) {
      if (!component.contains(nd)) continue;
      node_map.emplace(nd, g.node_pool_.size());
      g.nodes_.push_back(g.node_pool_.size());
      g.node_pool_.push_back(node(nd));
    }
    for (auto e : edges_) {
      if (!component.contains(edge(e).outgoing())) continue;
      edge_map.emplace(e, g.edge_pool_.size());
      g.edges_.push_back(g.edge_pool_.size());
      auto copy = edge(e);
      copy.set_outgoing(node_map.at(copy.outgoing()));
      copy.set_incoming(node_map.at(copy.incoming()));
      g.edge_pool_.push_back(copy);
    }
    for (auto& nd : g.node_pool_) {
      for (std::size_t k = 0; k != 3; ++k) nd.set_edge(k, edge_map.at(nd.edge(k)));
    }
    g.n_ = g.nodes_.size() / 2;

    if (result.empty()) {
      g.sign_ = sign_;
      g.deltas_ = deltas_;
      g.triangular_deltas_ = triangular_deltas_;
      g.sixjs_ = sixjs_;
      g.ninejs_ = ninejs_;
      g.twelvejfirsts_ = twelvejfirsts_;
      g.additional_indices_ = additional_indices_;
    }
    result.push_back(std::move(g));
  }

  if (Logger::instance().yutsis_graph)
    std::wcout << L"graph split into " << result.size()
               << L" disconnected graphs" << std::endl;

  return result;
}

std::optional<EdgeId> YutsisGraph::find_one_cycle() const {
  for (auto nd : nodes_) {
    for (auto e : node(nd).edges()) {
      if (node(nd).count(e) == 2) return e;
    }
  }
  return std::nullopt;
}

std::optional<std::array<EdgeId, 2>> YutsisGraph::find_bubble() const {
  for (std::size_t a = 0; a < nodes_.size(); ++a) {
    for (std::size_t b = a + 1; b < nodes_.size(); ++b) {
      const auto ab = common_edges(nodes_[a], nodes_[b]);
      if (ab.size() == 2) return std::array<EdgeId, 2>{ab[0], ab[1]};
    }
  }
  return std::nullopt;
}

std::optional<std::array<EdgeId, 3>> YutsisGraph::find_triangle() const {
  for (std::size_t a = 0; a < nodes_.size(); ++a) {
    for (std::size_t b = a + 1; b < nodes_.size(); ++b) {
      const auto ab = common_edges(nodes_[a], nodes_[b]);
      if (ab.size() != 1) continue;
      for (std::size_t c = b + 1; c < nodes_.size(); ++c) {
        const auto bc = common_edges(nodes_[b], nodes_[c]);
        const auto ca = common_edges(nodes_[c], nodes_[a]);
        if (bc.size() == 1 && ca.size() == 1)
          return std::array<EdgeId, 3>{ab[0], bc[0], ca[0]};
      }
    }
  }
  return std::nullopt;
}

std::optional<std::array<EdgeId, 4>> YutsisGraph::find_square() const {
  const auto size = nodes_.size();
  for (std::size_t a = 0; a < size; ++a) {
    const auto node_a = nodes_[a];
    for (std::size_t b = a + 1; b < size; ++b) {
      const auto node_b = nodes_[b];
      const auto ab = common_edges(node_a, node_b);
      if (ab.size() != 1) continue;
      for (std::size_t c = a + 1; c < size; ++c) {
        const auto node_c = nodes_[c];
        if (node_c == node_b) continue;
        const auto ac = common_edges(node_a, node_c);
        const auto bc = common_edges(node_b, node_c);
        for (std::size_t d = a + 1; d < size; ++d) {
          const auto node_d = nodes_[d];
          if (node_d == node_b || node_d == node_c) continue;
          if (ac.size() == 1 && bc.empty()) {
            // A-B-D-C-A
            const auto bd = common_edges(node_b, node_d);
            const auto cd = common_edges(node_c, node_d);
            if (bd.size() == 1 && cd.size() == 1)
              return std::array<EdgeId, 4>{ab[0], bd[0], cd[0], ac[0]};
          } else if (ac.empty() && bc.size() == 1) {
            // A-B-C-D-A
            const auto cd = common_edges(node_c, node_d);
            const auto da = common_edges(node_d, node_a);
            if (cd.size() == 1 && da.size() == 1)
              return std::array<EdgeId, 4>{ab[0], bc[0], cd[0], da[0]};
          }
        }
      }
    }
  }
  return std::nullopt;
}

void YutsisGraph::reduce_bubble(const std::array<EdgeId, 2>& bubble) {
  const auto [edge_a, edge_b] = bubble;
  const auto node1 = edge(edge_a).outgoing();
  const auto node2 = edge(edge_a).incoming();
  const auto ext1 = external_edge(node1, {edge_a, edge_b});
  const auto ext2 = external_edge(node2, {edge_a, edge_b});
  if (edge(ext1).other(node1) == edge(ext2).other(node2))
    throw InvariantViolation(
        "YutsisGraph::reduce_bubble: external lines close into a one-cycle");

  make_outgoing(edge_b, node1);
  make_outgoing(ext1, node1);
  make_incoming(ext2, node2);

  if (node(node1).first_of_two(edge_a, edge_b) ==
      node(node2).first_of_two(edge_a, edge_b))
    change_sign(node2, SignChange::Indirect);
  if (node(node1).sign() == node(node2).sign())
    change_sign(node2, SignChange::Direct);

  (*arena_)[idx_of(ext1)].jhat -= 2;

  const auto idx_a = idx_of(edge_a);
  const auto idx_b = idx_of(edge_b);

  n_ -= 1;
  remove_node(node1);
  remove_node(node2);
  remove_edge(edge_a);
  remove_edge(edge_b);

  deltas_.emplace_back(*arena_, idx_of(ext1), idx_of(ext2));
  edge_ref(ext1).set_idx(deltas_.back().first());
  triangular_deltas_.push_back({{idx_of(ext1), idx_a, idx_b}});
  merge_edges(ext1, ext2);
}

void YutsisGraph::reduce_triangle(const std::array<EdgeId, 3>& triangle) {
  const auto [edge_a, edge_b, edge_c] = triangle;
  const auto node_ab = common_node(edge_a, edge_b);
  const auto node_bc = common_node(edge_b, edge_c);
  const auto node_ca = common_node(edge_c, edge_a);
  const auto ext_ab = external_edge(node_ab, {edge_a, edge_b, edge_c});
  const auto ext_bc = external_edge(node_bc, {edge_a, edge_b, edge_c});
  const auto ext_ca = external_edge(node_ca, {edge_a, edge_b, edge_c});

  make_outgoing(edge_a, node_ab);
  make_outgoing(edge_b, node_bc);
  make_outgoing(edge_c, node_ca);
  make_outgoing(ext_ab, node_ab);
  make_outgoing(ext_bc, node_bc);
  make_outgoing(ext_ca, node_ca);

  if (node(node_ab).first_of_two(edge_a, edge_b) != edge_a)
    change_sign(node_ab, SignChange::Indirect);
  if (node(node_bc).first_of_two(edge_b, edge_c) != edge_b)
    change_sign(node_bc, SignChange::Indirect);
  if (node(node_ca).first_of_two(edge_c, edge_a) != edge_c)
    change_sign(node_ca, SignChange::Indirect);
  for (auto nd : {node_ab, node_bc, node_ca}) {
    if (node(nd).sign() != -1) change_sign(nd, SignChange::Direct);
  }

  // { BC CA AB }
  // { A  B  C  }
  sixjs_.emplace_back(*arena_,
                      std::array<IdxId, 6>{idx_of(ext_bc), idx_of(ext_ca),
                                           idx_of(ext_ab), idx_of(edge_a),
                                           idx_of(edge_b), idx_of(edge_c)});

  n_ -= 1;
  auto& merged = node_ref(node_ab);
  merged.set_sign(1);
  merged.place_first(ext_ab);
  merged.set_edge(1, ext_ca);
  merged.set_edge(2, ext_bc);
  edge_ref(ext_bc).set_outgoing(node_ab);
  edge_ref(ext_ca).set_outgoing(node_ab);
  remove_node(node_bc);
  remove_node(node_ca);
  remove_edge(edge_a);
  remove_edge(edge_b);
  remove_edge(edge_c);
}

void YutsisGraph::reduce_square(const std::array<EdgeId, 4>& square) {
  const auto [edge_a, edge_b, edge_c, edge_d] = square;
  const auto node_ab = common_node(edge_a, edge_b);
  const auto node_bc = common_node(edge_b, edge_c);
  const auto node_cd = common_node(edge_c, edge_d);
  const auto node_da = common_node(edge_d, edge_a);
  const auto ext_ab = external_edge(node_ab, {edge_a, edge_b, edge_c, edge_d});
  const auto ext_bc = external_edge(node_bc, {edge_a, edge_b, edge_c, edge_d});
  const auto ext_cd = external_edge(node_cd, {edge_a, edge_b, edge_c, edge_d});
  const auto ext_da = external_edge(node_da, {edge_a, edge_b, edge_c, edge_d});

  make_outgoing(edge_a, node_ab);
  make_outgoing(edge_b, node_bc);
  make_outgoing(edge_c, node_cd);
  make_outgoing(edge_d, node_da);
  make_outgoing(ext_ab, node_ab);
  make_outgoing(ext_bc, node_bc);
  make_outgoing(ext_cd, node_cd);
  make_outgoing(ext_da, node_da);

  if (node(node_ab).first_of_two(edge_a, edge_b) != edge_a)
    change_sign(node_ab, SignChange::Indirect);
  if (node(node_bc).first_of_two(edge_b, edge_c) != edge_b)
    change_sign(node_bc, SignChange::Indirect);
  if (node(node_cd).first_of_two(edge_c, edge_d) != edge_c)
    change_sign(node_cd, SignChange::Indirect);
  if (node(node_da).first_of_two(edge_d, edge_a) != edge_d)
    change_sign(node_da, SignChange::Indirect);
  for (auto nd : {node_ab, node_bc, node_cd, node_da}) {
    if (node(nd).sign() != -1) change_sign(nd, SignChange::Direct);
  }

  // the new index couples B and D
  auto& arena = *arena_;
  const auto x =
      arena.make(arena.coupled_type(idx_of(edge_b), idx_of(edge_d)));
  additional_indices_.push_back(x);
  const auto edge_x = add_edge(x);

  arena[x].jphase += 1;
  arena[idx_of(edge_b)].jphase += 1;
  arena[idx_of(edge_d)].jphase -= 1;
  arena[x].jhat += 2;

  // { AB DA x }   { BC CD x }
  // { D  B  A }   { D  B  C }
  sixjs_.emplace_back(arena, std::array<IdxId, 6>{idx_of(ext_ab),
                                                  idx_of(ext_da), x,
                                                  idx_of(edge_d),
                                                  idx_of(edge_b),
                                                  idx_of(edge_a)});
  sixjs_.emplace_back(arena, std::array<IdxId, 6>{idx_of(ext_bc),
                                                  idx_of(ext_cd), x,
                                                  idx_of(edge_d),
                                                  idx_of(edge_b),
                                                  idx_of(edge_c)});

  n_ -= 1;
  auto& first = node_ref(node_ab);
  first.set_sign(1);
  first.place_first(ext_ab);
  first.set_edge(1, ext_da);
  first.set_edge(2, edge_x);
  auto& second = node_ref(node_bc);
  second.set_sign(1);
  second.place_first(ext_bc);
  second.set_edge(1, edge_x);
  second.set_edge(2, ext_cd);
  edge_ref(ext_da).set_outgoing(node_ab);
  edge_ref(ext_cd).set_outgoing(node_bc);
  edge_ref(edge_x).set_outgoing(node_ab);
  edge_ref(edge_x).set_incoming(node_bc);
  remove_node(node_cd);
  remove_node(node_da);
  remove_edge(edge_a);
  remove_edge(edge_b);
  remove_edge(edge_c);
  remove_edge(edge_d);
}

void YutsisGraph::reduce_final() {
  if (nodes_.size() != 2 || edges_.size() != 3)
    throw InvariantViolation(
        "YutsisGraph::reduce_final: the graph is not a single pair of nodes "
        "sharing three edges");
  const auto node0 = nodes_[0];
  const auto node1 = nodes_[1];
  for (auto e : edges_) {
    if (!edge(e).touches(node0) || !edge(e).touches(node1))
      throw InvariantViolation(
          "YutsisGraph::reduce_final: an edge does not join the last two "
          "nodes");
    make_incoming(e, node0);
  }

  node_ref(node0).place_first(edges_[0]);
  node_ref(node1).place_first(edges_[0]);
  if (node(node0).first_of_two(edges_[1], edges_[2]) ==
      node(node1).first_of_two(edges_[1], edges_[2]))
    change_sign(node1, SignChange::Indirect);
  if (node(node0).sign() == node(node1).sign())
    change_sign(node1, SignChange::Direct);

  triangular_deltas_.push_back(
      {{idx_of(edges_[0]), idx_of(edges_[1]), idx_of(edges_[2])}});

  n_ -= 1;
  nodes_.clear();
  edges_.clear();
}

void YutsisGraph::reduce(std::size_t max_iterations) {
  const auto& logger = Logger::instance();
  std::size_t iteration = 0;
  while (nodes_.size() > 2) {
    if (iteration == max_iterations)
      throw GraphNotReducible(
          "YutsisGraph::reduce: maximum number of iterations (" +
          std::to_string(max_iterations) + ") reached");
    ++iteration;

    if (auto e = find_one_cycle()) {
      throw InvariantViolation(
          "YutsisGraph::reduce: one-cycle on index " +
          to_string((*arena_)[idx_of(*e)].label) +
          " after separation of single internal lines");
    } else if (auto bubble = find_bubble()) {
      if (logger.yutsis_reduce) std::wcout << L"bubble reduction" << std::endl;
      reduce_bubble(*bubble);
    } else if (auto triangle = find_triangle()) {
      if (logger.yutsis_reduce)
        std::wcout << L"triangle reduction" << std::endl;
      reduce_triangle(*triangle);
    } else if (auto square = find_square()) {
      if (logger.yutsis_reduce) std::wcout << L"square reduction" << std::endl;
      reduce_square(*square);
    } else {
      throw GraphNotReducible(
          "YutsisGraph::reduce: no bubble, triangle or square in a graph of " +
          std::to_string(nodes_.size()) + " nodes");
    }

    if (nodes_.size() != 2 * n_)
      throw InvariantViolation("YutsisGraph::reduce: node count mismatch");
  }

  if (nodes_.size() == 2) reduce_final();
  if (!nodes_.empty())
    throw InvariantViolation("YutsisGraph::reduce: odd number of nodes");

  remove_redundant_triangular_deltas();

  if (logger.yutsis_reduce) std::wcout << to_wstring();
}

void YutsisGraph::remove_redundant_triangular_deltas() {
  auto it = ranges::remove_if(triangular_deltas_, [&](const auto& tri) {
    return ranges::any_of(sixjs_,
                          [&](const SixJ& sixj) { return sixj.contains(tri); });
  });
  triangular_deltas_.erase(it, triangular_deltas_.end());
}

void YutsisGraph::merge(const YutsisGraph& other) {
  if (n_ != 0 || other.n_ != 0)
    throw InvariantViolation(
        "YutsisGraph::merge: only fully reduced graphs can be merged");
  sign_ *= other.sign_;
  deltas_.insert(deltas_.end(), other.deltas_.begin(), other.deltas_.end());
  triangular_deltas_.insert(triangular_deltas_.end(),
                            other.triangular_deltas_.begin(),
                            other.triangular_deltas_.end());
  sixjs_.insert(sixjs_.end(), other.sixjs_.begin(), other.sixjs_.end());
  ninejs_.insert(ninejs_.end(), other.ninejs_.begin(), other.ninejs_.end());
  twelvejfirsts_.insert(twelvejfirsts_.end(), other.twelvejfirsts_.begin(),
                        other.twelvejfirsts_.end());
  additional_indices_.insert(additional_indices_.end(),
                             other.additional_indices_.begin(),
                             other.additional_indices_.end());
}

container::svector<std::size_t, 3> YutsisGraph::sixjs_containing(
    IdxId x) const {
  container::svector<std::size_t, 3> result;
  for (std::size_t k = 0; k != sixjs_.size(); ++k) {
    if (sixjs_[k].contains(x)) result.push_back(k);
  }
  return result;
}

void YutsisGraph::erase_sixjs(container::svector<std::size_t, 3> positions) {
  ranges::sort(positions, ranges::greater{});
  for (auto k : positions)
    sixjs_.erase(sixjs_.begin() + static_cast<std::ptrdiff_t>(k));
}

void YutsisGraph::consume_additional_index(IdxId x) {
  auto it = ranges::find(additional_indices_, x);
  if (it != additional_indices_.end()) additional_indices_.erase(it);
  (*arena_)[x].set_default();
}

void YutsisGraph::collect_ninejs() {
  const auto candidates = additional_indices_;
  for (auto x : candidates) collect_ninej(x);
}

bool YutsisGraph::collect_ninej(IdxId x) {
  auto& arena = *arena_;
  const auto positions = sixjs_containing(x);
  if (positions.size() != 3) return false;
  if (detail::floor_mod(arena[x].jphase, 2) != 0) return false;
  if (arena[x].jhat != 2) return false;

  // x goes to the middle row, in column 2, 1 and 0 respectively
  for (std::size_t k = 0; k != 3; ++k) {
    auto& sixj = sixjs_[positions[k]];
    const auto pos = *sixj.position(x);
    const auto col = pos % 3;
    if (pos / 3 != 1) sixj.swap_rows_in_columns(col, (col + 1) % 3);
    if (col != 2 - k) sixj.swap_columns(col, 2 - k);
  }

  auto& sixj1 = sixjs_[positions[0]];
  auto& sixj2 = sixjs_[positions[1]];
  auto& sixj3 = sixjs_[positions[2]];

  auto require = [](bool condition) {
    if (!condition)
      throw InvariantViolation(
          "YutsisGraph::collect_ninej: 6j-symbols are not adjacent as "
          "required by the 9j factorization");
  };
  auto position_in = [&](const SixJ& sixj, IdxId id) {
    const auto pos = sixj.position(id);
    require(pos.has_value());
    return *pos;
  };

  const auto idx7 = sixj1.indices()[2];
  const auto idx5 = sixj2.indices()[1];
  const auto idx3 = sixj3.indices()[0];

  if (sixj2.contains(sixj1.indices()[0])) sixj1.swap_rows_in_columns(0, 1);

  const auto idx8 = sixj1.indices()[3];
  {
    const auto pos = position_in(sixj2, idx8);
    if (pos / 3 == 1) sixj2.swap_rows_in_columns(0, 2);
    if (pos % 3 == 0) sixj2.swap_columns(0, 2);
  }

  const auto idx4 = sixj1.indices()[1];
  require(position_in(sixj2, idx4) == 3);

  const auto idx1 = sixj1.indices()[0];
  {
    const auto pos = position_in(sixj3, idx1);
    if (pos / 3 == 0) sixj3.swap_rows_in_columns(1, 2);
    if (pos % 3 == 2) sixj3.swap_columns(1, 2);
  }

  const auto idx9 = sixj1.indices()[4];
  require(position_in(sixj3, idx9) == 2);
  const auto idx2 = sixj2.indices()[0];
  require(position_in(sixj3, idx2) == 5);
  const auto idx6 = sixj2.indices()[5];
  require(position_in(sixj3, idx6) == 1);

  // (-1)^{2x}
  arena[x].simplify();
  if (arena[x].type == JType::HalfInteger) arena[x].sign = -arena[x].sign;
  sign_ *= arena[x].sign;

  if (Logger::instance().collect_symbols)
    std::wcout << L"9j-symbol collected over " << arena[x].label << std::endl;

  consume_additional_index(x);
  erase_sixjs(positions);
  ninejs_.emplace_back(arena, std::array<IdxId, 9>{idx1, idx2, idx3, idx4,
                                                    idx5, idx6, idx7, idx8,
                                                    idx9});
  return true;
}

void YutsisGraph::collect_twelvejfirsts() {
  const auto candidates = additional_indices_;
  for (auto x : candidates) collect_twelvejfirst(x);
}

bool YutsisGraph::collect_twelvejfirst(IdxId x) {
  //                    { j1  j2   j3   j4   }
  //                    {   j5   j6   j7   j8}
  // (-1)^{j1+j3-j9-j11} { j9  j10  j11  j12  }
  //
  //                { j1  j3  x   }
  //                { j8  j4  j9  } { j3  j1  x   } { j9  j11 x   }
  // = sum_x (2x+1) { j12 j7  j11 } { j5  j6  j2  } { j6  j5  j10 }
  auto& arena = *arena_;
  const auto positions = sixjs_containing(x);
  if (positions.size() != 2) return false;

  container::svector<std::size_t, 1> ninej_positions;
  for (std::size_t k = 0; k != ninejs_.size(); ++k) {
    if (ninejs_[k].contains(x)) ninej_positions.push_back(k);
  }
  if (ninej_positions.size() != 1) return false;
  if (arena[x].jhat != 2) return false;

  auto& ninej = ninejs_[ninej_positions[0]];
  auto& sixj1 = sixjs_[positions[0]];
  auto& sixj2 = sixjs_[positions[1]];

  auto require = [](bool condition) {
    if (!condition)
      throw InvariantViolation(
          "YutsisGraph::collect_twelvejfirst: symbols are not adjacent as "
          "required by the 12j factorization");
  };

  ninej.place_index(x, 2, arena);
  for (auto* sixj : {&sixj1, &sixj2}) {
    const auto pos = *sixj->position(x);
    const auto col = pos % 3;
    if (pos / 3 != 0) sixj->swap_rows_in_columns(col, (col + 1) % 3);
    if (col != 2) sixj->swap_columns(col, 2);
  }

  const auto idx2 = sixj1.indices()[5];
  const auto idx10 = sixj2.indices()[5];
  require(!sixj2.contains(idx2) && !ninej.contains(idx2));
  require(!sixj1.contains(idx10) && !ninej.contains(idx10));

  if (!ninej.contains(sixj1.indices()[0])) sixj1.swap_rows_in_columns(0, 1);
  if (sixj1.indices()[0] != ninej.indices()[0] &&
      sixj1.indices()[0] != ninej.indices()[1])
    ninej.reflect_anti_diagonal();
  if (sixj1.indices()[0] != ninej.indices()[1]) ninej.swap_columns(0, 1, arena);
  require(sixj1.indices()[0] == ninej.indices()[1] &&
          sixj1.indices()[1] == ninej.indices()[0]);
  const auto idx3 = sixj1.indices()[0];
  const auto idx1 = sixj1.indices()[1];
  const auto idx5 = sixj1.indices()[3];
  const auto idx6 = sixj1.indices()[4];

  // checked only now since the 9j permutations change the phase of x
  if (detail::floor_mod(arena[x].jphase, 2) != 0) return false;

  if (!ninej.contains(sixj2.indices()[0])) sixj2.swap_rows_in_columns(0, 1);
  if (sixj2.indices()[4] != sixj1.indices()[3]) sixj2.swap_columns(0, 1);
  require(sixj2.indices()[0] == ninej.indices()[5] &&
          sixj2.indices()[1] == ninej.indices()[8]);
  const auto idx9 = sixj2.indices()[0];
  const auto idx11 = sixj2.indices()[1];
  require(sixj2.indices()[4] == idx5 && sixj2.indices()[3] == idx6);

  const auto idx8 = ninej.indices()[3];
  const auto idx4 = ninej.indices()[4];
  const auto idx12 = ninej.indices()[6];
  const auto idx7 = ninej.indices()[7];
  for (auto id : {idx8, idx4, idx12, idx7})
    require(!sixj1.contains(id) && !sixj2.contains(id));

  arena[idx1].jphase += 1;
  arena[idx3].jphase += 1;
  arena[idx9].jphase -= 1;
  arena[idx11].jphase -= 1;

  arena[x].simplify();
  sign_ *= arena[x].sign;

  if (Logger::instance().collect_symbols)
    std::wcout << L"12j-symbol of the first kind collected over "
               << arena[x].label << std::endl;

  consume_additional_index(x);
  ninejs_.erase(ninejs_.begin() +
                static_cast<std::ptrdiff_t>(ninej_positions[0]));
  erase_sixjs(positions);
  twelvejfirsts_.push_back({{idx1, idx2, idx3, idx4, idx5, idx6, idx7, idx8,
                             idx9, idx10, idx11, idx12}});
  return true;
}

std::wstring YutsisGraph::to_wstring() const {
  const auto& arena = *arena_;
  std::wstring result = std::format(L"YutsisGraph n={} sign={:+}\n", n_, sign_);
  for (auto nd : nodes_) {
    result += std::format(L"  node {} ({:+}):", nd, node(nd).sign());
    for (auto e : node(nd).edges()) result += L" " + arena[idx_of(e)].label;
    result += L"\n";
  }
  for (auto e : edges_) {
    result += std::format(L"  edge {}: {} -> {}\n", arena[idx_of(e)].label,
                          edge(e).outgoing(), edge(e).incoming());
  }
  for (const auto& delta : deltas_)
    result += L"  " + delta.to_wstring(arena) + L"\n";
  for (const auto& tri : triangular_deltas_)
    result += L"  " + tri.to_wstring(arena) + L"\n";
  for (const auto& sixj : sixjs_)
    result += L"  " + sixj.to_wstring(arena) + L"\n";
  for (const auto& ninej : ninejs_)
    result += L"  " + ninej.to_wstring(arena) + L"\n";
  for (const auto& twelvej : twelvejfirsts_)
    result += L"  " + twelvej.to_wstring(arena) + L"\n";
  return result;
}

}  // namespace amc::yutsis
