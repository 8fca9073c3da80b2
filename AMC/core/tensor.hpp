#ifndef AMC_CORE_TENSOR_HPP
#define AMC_CORE_TENSOR_HPP

#include <AMC/core/container.hpp>
#include <AMC/core/index.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace amc {

/// @brief binary coupling tree of the subscripts of a tensor
///
/// Leaves are 1-based subscript slots. A negative leaf couples the
/// time-reversed state of its slot. Every inner node couples the angular
/// momenta of its children to a new collective angular momentum, and the two
/// children of the root are coupled to the rank of the tensor.
///
/// Example: `CouplingScheme{{1, -4}, {3, -2}}` couples 1 and time-reversed 4
/// to J0, 3 and time-reversed 2 to J1, and J0 and J1 to the rank.
class CouplingScheme {
 public:
  /// leaf for slot `|slot|`
  CouplingScheme(int slot);

  CouplingScheme(CouplingScheme left, CouplingScheme right);

  bool is_leaf() const { return left_ == nullptr; }

  /// @pre is_leaf()
  int leaf() const;
  /// @pre !is_leaf()
  const CouplingScheme& left() const;
  /// @pre !is_leaf()
  const CouplingScheme& right() const;

  /// @return the number of inner nodes
  std::size_t ncouplings() const;

  /// @brief checks that every slot in [1, @p nslots] appears exactly once
  /// @throw std::invalid_argument otherwise
  void validate(std::size_t nslots) const;

  /// @return the scheme `((start, start+1), start+2), ...` over @p num
  /// consecutive slots
  /// @pre num > 0
  static CouplingScheme left_to_right(int start, std::size_t num);

  /// @return the default scheme of a tensor with @p ncreators creator and
  /// @p nannihilators annihilator slots, or nullopt if it has no slots
  static std::optional<CouplingScheme> make_default(std::size_t ncreators,
                                                    std::size_t nannihilators);

  std::wstring to_wstring() const;

  friend bool operator==(const CouplingScheme& s1, const CouplingScheme& s2);

 private:
  int leaf_ = 0;
  std::shared_ptr<const CouplingScheme> left_;
  std::shared_ptr<const CouplingScheme> right_;
};

/// @brief declares a tensor that variables can refer to
class TensorDeclaration {
 public:
  struct Attributes {
    /// tensor has rank zero
    bool scalar = true;
    /// use reduced matrix elements even for a scalar tensor; always true for
    /// nonscalar tensors
    bool reduce = false;
    /// diagonal tensors have half as many subscripts and are not coupled
    bool diagonal = false;
    /// the coupling scheme, CouplingScheme::make_default() if omitted
    std::optional<CouplingScheme> scheme = std::nullopt;
  };

  /// @throw std::invalid_argument if the scheme is invalid for the mode, is a
  /// single leaf, or is given for a diagonal tensor
  TensorDeclaration(std::wstring name, std::size_t ncreators,
                    std::size_t nannihilators, Attributes attributes = {});

  const std::wstring& name() const { return name_; }
  std::pair<std::size_t, std::size_t> mode() const {
    return {ncreators_, nannihilators_};
  }
  std::size_t total_mode() const { return ncreators_ + nannihilators_; }
  bool scalar() const { return scalar_; }
  bool reduce() const { return reduce_; }
  bool diagonal() const { return diagonal_; }
  const std::optional<CouplingScheme>& scheme() const { return scheme_; }

  /// @return the number of subscripts of a variable of this tensor
  std::size_t nsubscripts() const {
    return diagonal_ ? total_mode() / 2 : total_mode();
  }

  std::wstring to_wstring() const;

 private:
  std::wstring name_;
  std::size_t ncreators_;
  std::size_t nannihilators_;
  bool scalar_;
  bool reduce_;
  bool diagonal_;
  std::optional<CouplingScheme> scheme_;
};

using TensorPtr = std::shared_ptr<const TensorDeclaration>;

template <typename... Args>
TensorPtr make_tensor(Args&&... args) {
  return std::make_shared<const TensorDeclaration>(std::forward<Args>(args)...);
}

/// @brief an uncoupled tensor with subscripts
class Variable {
 public:
  /// @throw std::invalid_argument if @p tensor is null or the number of
  /// subscripts does not match it
  Variable(TensorPtr tensor, container::vector<Index> subscripts);

  const TensorDeclaration& tensor() const { return *tensor_; }
  const TensorPtr& tensor_ptr() const { return tensor_; }
  const container::vector<Index>& subscripts() const { return subscripts_; }

  /// @return the index in 1-based slot `|slot|`
  const Index& subscript(int slot) const;

  /// @return the set of subscripts
  container::set<Index> depends_on() const;

  std::wstring to_wstring() const;

 private:
  TensorPtr tensor_;
  container::vector<Index> subscripts_;
};

/// @brief a coupled tensor: a Variable and the labels of its coupled angular
/// momenta
///
/// There is one label per coupling of the scheme, in post-order, followed by
/// the rank label.
class ReducedVariable {
 public:
  /// @throw std::invalid_argument if the number of labels does not match the
  /// scheme
  ReducedVariable(Variable variable, container::vector<Index> labels);

  const Variable& variable() const { return variable_; }
  const TensorDeclaration& tensor() const { return variable_.tensor(); }
  const container::vector<Index>& subscripts() const {
    return variable_.subscripts();
  }
  const container::vector<Index>& labels() const { return labels_; }
  const Index& rank() const { return labels_.back(); }

  std::wstring to_wstring() const;

 private:
  Variable variable_;
  container::vector<Index> labels_;
};

}  // namespace amc

#endif  // AMC_CORE_TENSOR_HPP
