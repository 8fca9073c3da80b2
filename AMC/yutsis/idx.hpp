#ifndef AMC_YUTSIS_IDX_HPP
#define AMC_YUTSIS_IDX_HPP

#include <AMC/core/container.hpp>
#include <AMC/core/jtype.hpp>

#include <compare>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>

namespace amc::yutsis {

/// handle of an Idx inside its IdxArena
struct IdxId {
  std::size_t value = std::numeric_limits<std::size_t>::max();

  bool valid() const { return value != std::numeric_limits<std::size_t>::max(); }

  friend auto operator<=>(const IdxId&, const IdxId&) = default;
};

/// @brief an angular-momentum index of the coupling network
///
/// Besides its identity, an Idx accumulates the factors produced by the
/// symmetry transformations applied to the network:
/// \f$ \mathrm{sign} \cdot (-1)^{\mathrm{jphase} \cdot j + \mathrm{mphase}
/// \cdot m} \hat{j}^{\mathrm{jhat}} \f$
struct Idx {
  struct Properties {
    bool is_particle = false;
    bool zero = false;
    bool external = false;
    bool rank = false;
  };

  Idx(JType type, std::wstring label, Properties properties);

  JType type;
  std::wstring label;
  bool is_particle = false;
  bool zero = false;
  bool external = false;
  bool rank = false;

  int jphase = 0;
  int mphase = 0;
  int sign = 1;
  int jhat = 0;

  /// set by delta handling, always points to a root index
  std::optional<IdxId> constrained_to;

  /// reduces the phases modulo their period, moving (-1)^{2j} and (-1)^{2m}
  /// of half-integer indices into the sign; a zero index drops all factors
  void simplify();

  /// resets the accumulators
  void set_default();

  /// moves the accumulators of @p other onto this
  void absorb(Idx& other);

  std::wstring to_wstring() const;
};

/// @brief owns the Idx objects of one reduction
///
/// Indices are shared by the whole coupling network (Clebsch-Gordan
/// coefficients, 3JM-symbols, graph edges, output symbols), which refer to
/// them by IdxId.
class IdxArena {
 public:
  IdxArena() = default;

  /// creates an index labeled "J<n>" (integer) or "j<n>" (half-integer), with
  /// n counting per type within this arena
  IdxId make(JType type, Idx::Properties properties = {});

  /// creates an index with label @p label
  IdxId make(JType type, std::wstring label, Idx::Properties properties = {});

  Idx& operator[](IdxId id);
  const Idx& operator[](IdxId id) const;

  std::size_t size() const { return indices_.size(); }

  /// @return the index @p id is constrained to, or @p id itself
  IdxId root(IdxId id) const;

  /// constrains @p from to be equal to @p to: the accumulators of @p from are
  /// transferred to @p to, and every index constrained to @p from is
  /// redirected to @p to so that chains never grow beyond one link
  /// @throw InvariantViolation if the types differ or @p to is constrained
  void set_constraint(IdxId from, IdxId to);

  JType coupled_type(IdxId id1, IdxId id2) const;

 private:
  container::vector<Idx> indices_;
  std::size_t next_integer_ = 0;
  std::size_t next_half_integer_ = 0;

  void check(IdxId id) const;
};

}  // namespace amc::yutsis

#endif  // AMC_YUTSIS_IDX_HPP
