#ifndef AMC_YUTSIS_GRAPH_HPP
#define AMC_YUTSIS_GRAPH_HPP

#include <AMC/yutsis/delta.hpp>
#include <AMC/yutsis/edge.hpp>
#include <AMC/yutsis/idx.hpp>
#include <AMC/yutsis/ninej.hpp>
#include <AMC/yutsis/node.hpp>
#include <AMC/yutsis/sixj.hpp>
#include <AMC/yutsis/threejm.hpp>
#include <AMC/yutsis/triangular_delta.hpp>
#include <AMC/yutsis/twelvej.hpp>

#include <AMC/core/container.hpp>

#include <array>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>

namespace amc::yutsis {

/// @brief Yutsis graph of a closed string of 3JM-symbols
///
/// Every 3JM-symbol is a node, every index shared by two symbols is an
/// edge. The graph is dissolved by local rewriting rules into Kronecker
/// deltas, triangular deltas and 6j-symbols, with all phases and hat factors
/// accumulated on the indices of the IdxArena the graph was built on.
/// Nodes and edges are referred to by ids; the order of the node and edge
/// lists is the order in which the searches visit them.
class YutsisGraph {
 public:
  /// builds the graph of @p threejms, which must be canonicalized
  /// @throw InvariantViolation if an index does not appear in exactly two
  /// slots with opposite signs
  YutsisGraph(IdxArena& arena, const container::vector<ThreeJM>& threejms,
              container::vector<Delta> deltas, IdxId zero);

  YutsisGraph(const YutsisGraph&) = default;
  YutsisGraph(YutsisGraph&&) = default;
  YutsisGraph& operator=(const YutsisGraph&) = default;
  YutsisGraph& operator=(YutsisGraph&&) = default;

  /// number of 3JM-symbol pairs still in the graph
  std::size_t n() const { return n_; }
  std::size_t get_number_of_nodes() const { return nodes_.size(); }
  std::size_t get_number_of_edges() const { return edges_.size(); }

  const container::vector<NodeId>& nodes() const { return nodes_; }
  const container::vector<EdgeId>& edges() const { return edges_; }
  const YutsisNode& node(NodeId id) const { return node_pool_.at(id); }
  const YutsisEdge& edge(EdgeId id) const { return edge_pool_.at(id); }

  /// overall sign produced by the factorizations
  int sign() const { return sign_; }
  IdxId zero() const { return zero_; }
  IdxArena& arena() const { return *arena_; }

  const container::vector<Delta>& deltas() const { return deltas_; }
  container::vector<Delta>& deltas() { return deltas_; }
  const container::vector<TriangularDelta>& triangular_deltas() const {
    return triangular_deltas_;
  }
  const container::vector<SixJ>& sixjs() const { return sixjs_; }
  container::vector<SixJ>& sixjs() { return sixjs_; }
  const container::vector<NineJ>& ninejs() const { return ninejs_; }
  const container::vector<TwelveJFirst>& twelvejfirsts() const {
    return twelvejfirsts_;
  }
  /// indices synthesized by square reductions
  const container::vector<IdxId>& additional_indices() const {
    return additional_indices_;
  }

  /// removes every single internal line, i.e. every edge whose removal
  /// splits its component into two parts with an odd number of nodes
  void separate();

  /// @return the connected components of this graph, with nodes and edges in
  /// their relative order; the first one also carries the deltas, the
  /// emitted symbols and the sign
  container::vector<YutsisGraph> disconnected_graphs() const;

  /// applies bubble, triangle and square reductions until two nodes are
  /// left, closes the graph with the final triangular delta and drops the
  /// triangular deltas implied by 6j-symbols
  /// @throw GraphNotReducible if no rule applies or @p max_iterations rule
  /// applications do not suffice; the graph is left as is
  void reduce(std::size_t max_iterations);

  /// appends the output of the fully reduced graph @p other to this one
  void merge(const YutsisGraph& other);

  std::optional<EdgeId> find_one_cycle() const;
  std::optional<std::array<EdgeId, 2>> find_bubble() const;
  std::optional<std::array<EdgeId, 3>> find_triangle() const;
  std::optional<std::array<EdgeId, 4>> find_square() const;

  void reduce_bubble(const std::array<EdgeId, 2>& bubble);
  void reduce_triangle(const std::array<EdgeId, 3>& triangle);
  void reduce_square(const std::array<EdgeId, 4>& square);

  /// closes a graph of two nodes sharing three edges into a triangular delta
  void reduce_final();

  void remove_redundant_triangular_deltas();

  /// @brief factorizes 9j-symbols out of the sums over square indices,
  /// \f$ \sum_x (-1)^{2x} (2x+1)
  /// \begin{Bmatrix} j_1 & j_4 & j_7 \\ j_8 & j_9 & x \end{Bmatrix}
  /// \begin{Bmatrix} j_2 & j_5 & j_8 \\ j_4 & x & j_6 \end{Bmatrix}
  /// \begin{Bmatrix} j_3 & j_6 & j_9 \\ x & j_1 & j_2 \end{Bmatrix}
  /// = \begin{Bmatrix} j_1 & j_2 & j_3 \\ j_4 & j_5 & j_6 \\ j_7 & j_8 & j_9
  /// \end{Bmatrix} \f$
  void collect_ninejs();

  /// @brief factorizes 12j-symbols of the first kind out of the sums over
  /// square indices shared by one 9j-symbol and two 6j-symbols
  void collect_twelvejfirsts();

  /// @return true if the 9j-symbol was formed
  bool collect_ninej(IdxId x);
  /// @return true if the 12j-symbol was formed
  bool collect_twelvejfirst(IdxId x);

  std::wstring to_wstring() const;

 private:
  IdxArena* arena_;
  IdxId zero_;
  std::size_t n_ = 0;
  int sign_ = 1;

  container::vector<YutsisNode> node_pool_;
  container::vector<YutsisEdge> edge_pool_;
  container::vector<NodeId> nodes_;
  container::vector<EdgeId> edges_;

  container::vector<Delta> deltas_;
  container::vector<TriangularDelta> triangular_deltas_;
  container::vector<SixJ> sixjs_;
  container::vector<NineJ> ninejs_;
  container::vector<TwelveJFirst> twelvejfirsts_;
  container::vector<IdxId> additional_indices_;

  /// empty graph
  YutsisGraph(IdxArena& arena, IdxId zero);

  YutsisNode& node_ref(NodeId id) { return node_pool_.at(id); }
  YutsisEdge& edge_ref(EdgeId id) { return edge_pool_.at(id); }
  IdxId idx_of(EdgeId id) const { return edge(id).idx(); }

  EdgeId add_edge(IdxId idx);
  void remove_node(NodeId id);
  void remove_edge(EdgeId id);

  container::svector<EdgeId, 3> common_edges(NodeId a, NodeId b) const;
  NodeId common_node(EdgeId a, EdgeId b) const;
  EdgeId external_edge(NodeId node, std::initializer_list<EdgeId> internal) const;

  /// nodes reachable from @p start without crossing @p excluded
  container::vector<NodeId> connected_nodes(
      NodeId start, std::optional<EdgeId> excluded = std::nullopt) const;

  void make_outgoing(EdgeId e, NodeId node);
  void make_incoming(EdgeId e, NodeId node);
  void change_sign(NodeId node, SignChange kind);

  /// reconnects the outgoing end of @p outgoing_edge to where
  /// @p incoming_edge starts, and removes @p incoming_edge
  void merge_edges(EdgeId outgoing_edge, EdgeId incoming_edge);

  void separate_single_internal_line(EdgeId e);

  container::svector<std::size_t, 3> sixjs_containing(IdxId x) const;
  void erase_sixjs(container::svector<std::size_t, 3> positions);
  void consume_additional_index(IdxId x);
};

}  // namespace amc::yutsis

#endif  // AMC_YUTSIS_GRAPH_HPP
