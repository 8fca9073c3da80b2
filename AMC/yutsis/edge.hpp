#ifndef AMC_YUTSIS_EDGE_HPP
#define AMC_YUTSIS_EDGE_HPP

#include <AMC/yutsis/idx.hpp>

#include <array>
#include <cstddef>
#include <limits>
#include <utility>

namespace amc::yutsis {

using NodeId = std::size_t;
using EdgeId = std::size_t;

constexpr NodeId null_node = std::numeric_limits<NodeId>::max();

/// @brief directed edge of a Yutsis graph, carrying one angular-momentum index
///
/// The edge points from its outgoing node (where the projection enters with
/// sign +1) to its incoming node (sign -1).
class YutsisEdge {
 public:
  explicit YutsisEdge(IdxId idx) : idx_(idx) {}

  IdxId idx() const { return idx_; }
  void set_idx(IdxId idx) { idx_ = idx; }

  NodeId outgoing() const { return nodes_[0]; }
  NodeId incoming() const { return nodes_[1]; }
  void set_outgoing(NodeId node) { nodes_[0] = node; }
  void set_incoming(NodeId node) { nodes_[1] = node; }

  const std::array<NodeId, 2>& nodes() const { return nodes_; }

  bool touches(NodeId node) const {
    return nodes_[0] == node || nodes_[1] == node;
  }

  /// the end of the edge that is not @p node
  NodeId other(NodeId node) const {
    return nodes_[0] == node ? nodes_[1] : nodes_[0];
  }

  /// reverses the edge, adding \f$ (-1)^{2j} \f$
  void change_direction(IdxArena& arena) {
    arena[idx_].jphase += 2;
    std::swap(nodes_[0], nodes_[1]);
  }

 private:
  IdxId idx_;
  std::array<NodeId, 2> nodes_ = {null_node, null_node};
};

}  // namespace amc::yutsis

#endif  // AMC_YUTSIS_EDGE_HPP
