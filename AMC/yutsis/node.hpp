#ifndef AMC_YUTSIS_NODE_HPP
#define AMC_YUTSIS_NODE_HPP

#include <AMC/yutsis/edge.hpp>

#include <AMC/yutsis/exception.hpp>

#include <array>
#include <cstddef>

namespace amc::yutsis {

/// how a node sign change is realized
enum class SignChange {
  /// odd permutation of the 3JM-symbol columns, adds
  /// \f$ (-1)^{j_1 + j_2 + j_3} \f$
  Direct,
  /// reinterpretation of the cyclic order only, no phase
  Indirect
};

/// @brief trivalent node of a Yutsis graph, i.e. one 3JM-symbol
///
/// The three edges are stored in the cyclic order of the symbol's columns;
/// the sign tells whether this order is read counterclockwise (+1) or
/// clockwise (-1).
class YutsisNode {
 public:
  YutsisNode() = default;
  explicit YutsisNode(std::array<EdgeId, 3> edges) : edges_(edges) {}

  int sign() const { return sign_; }
  void set_sign(int sign) { sign_ = sign; }

  const std::array<EdgeId, 3>& edges() const { return edges_; }
  EdgeId edge(std::size_t k) const { return edges_.at(k); }
  void set_edge(std::size_t k, EdgeId e) { edges_.at(k) = e; }

  bool has(EdgeId e) const {
    return edges_[0] == e || edges_[1] == e || edges_[2] == e;
  }

  std::size_t count(EdgeId e) const {
    return (edges_[0] == e) + (edges_[1] == e) + (edges_[2] == e);
  }

  /// @return whichever of @p a and @p b is immediately followed by the other
  /// in the cyclic order of this node
  EdgeId first_of_two(EdgeId a, EdgeId b) const {
    auto is_ab = [&](EdgeId e) { return e == a || e == b; };
    if (is_ab(edges_[0])) return is_ab(edges_[1]) ? edges_[0] : edges_[2];
    return edges_[1];
  }

  /// cyclically rotates the edges so that @p e comes first
  void place_first(EdgeId e) {
    if (edges_[1] == e) {
      edges_ = {edges_[1], edges_[2], edges_[0]};
    } else if (edges_[2] == e) {
      edges_ = {edges_[2], edges_[0], edges_[1]};
    } else if (edges_[0] != e) {
      throw InvariantViolation("YutsisNode::place_first: edge not attached");
    }
  }

 private:
  int sign_ = 1;
  std::array<EdgeId, 3> edges_ = {};
};

}  // namespace amc::yutsis

#endif  // AMC_YUTSIS_NODE_HPP
