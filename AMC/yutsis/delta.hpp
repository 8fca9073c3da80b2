#ifndef AMC_YUTSIS_DELTA_HPP
#define AMC_YUTSIS_DELTA_HPP

#include <AMC/yutsis/idx.hpp>

#include <array>
#include <string>

namespace amc::yutsis {

/// @brief Kronecker delta \f$ \delta_{j_1 j_2} \f$ between two indices of the
/// same type
///
/// The two indices are kept ordered: zero indices first, then external
/// ones, then by label.
class Delta {
 public:
  /// @throw InvariantViolation if the two indices have different types
  Delta(const IdxArena& arena, IdxId idx1, IdxId idx2);

  const std::array<IdxId, 2>& indices() const { return indices_; }
  IdxId first() const { return indices_[0]; }
  IdxId second() const { return indices_[1]; }

  bool contains(IdxId id) const {
    return indices_[0] == id || indices_[1] == id;
  }

  /// moves the accumulators of the second index onto the first one
  void apply(IdxArena& arena) const;

  std::wstring to_wstring(const IdxArena& arena) const;

  friend bool operator==(const Delta&, const Delta&) = default;

 private:
  std::array<IdxId, 2> indices_;
};

}  // namespace amc::yutsis

#endif  // AMC_YUTSIS_DELTA_HPP
