#include <AMC/core/tensor.hpp>

#include <AMC/core/utility/macros.hpp>
#include <AMC/core/wstring.hpp>

#include <range/v3/algorithm/find.hpp>

#include <algorithm>
#include <cstdlib>
#include <format>
#include <stdexcept>

namespace amc {

CouplingScheme::CouplingScheme(int slot) : leaf_(slot) {
  if (slot == 0)
    throw std::invalid_argument(
        "CouplingScheme: slots are numbered starting from 1");
}

CouplingScheme::CouplingScheme(CouplingScheme left, CouplingScheme right)
    : left_(std::make_shared<const CouplingScheme>(std::move(left))),
      right_(std::make_shared<const CouplingScheme>(std::move(right))) {}

int CouplingScheme::leaf() const {
  AMC_ASSERT(is_leaf(), "CouplingScheme::leaf: not a leaf");
  return leaf_;
}

const CouplingScheme& CouplingScheme::left() const {
  AMC_ASSERT(!is_leaf(), "CouplingScheme::left: scheme is a leaf");
  return *left_;
}

const CouplingScheme& CouplingScheme::right() const {
  AMC_ASSERT(!is_leaf(), "CouplingScheme::right: scheme is a leaf");
  return *right_;
}

std::size_t CouplingScheme::ncouplings() const {
  if (is_leaf()) return 0;
  return 1 + left_->ncouplings() + right_->ncouplings();
}

void CouplingScheme::validate(std::size_t nslots) const {
  container::vector<bool> seen(nslots, false);

  auto rec = [&](const CouplingScheme& s, auto&& self) -> void {
    if (!s.is_leaf()) {
      self(*s.left_, self);
      self(*s.right_, self);
      return;
    }
    const auto slot = static_cast<std::size_t>(std::abs(s.leaf_));
    if (slot > nslots)
      throw std::invalid_argument(
          std::format("CouplingScheme: unexpected slot {} in {}, expected a "
                      "number between 1 and {}",
                      slot, to_string(to_wstring()), nslots));
    if (seen[slot - 1])
      throw std::invalid_argument(std::format(
          "CouplingScheme: duplicate slot {} in {}", slot,
          to_string(to_wstring())));
    seen[slot - 1] = true;
  };
  rec(*this, rec);

  const auto missing = ranges::find(seen, false);
  if (missing != seen.end())
    throw std::invalid_argument(std::format(
        "CouplingScheme: slot {} missing from {}",
        (missing - seen.begin()) + 1, to_string(to_wstring())));
}

CouplingScheme CouplingScheme::left_to_right(int start, std::size_t num) {
  AMC_ASSERT(num > 0, "CouplingScheme::left_to_right: no slots");
  CouplingScheme result(start);
  for (std::size_t k = 1; k != num; ++k)
    result = CouplingScheme(std::move(result), start + static_cast<int>(k));
  return result;
}

std::optional<CouplingScheme> CouplingScheme::make_default(
    std::size_t ncreators, std::size_t nannihilators) {
  if (ncreators != 0 && nannihilators != 0)
    return CouplingScheme(
        left_to_right(1, ncreators),
        left_to_right(static_cast<int>(ncreators) + 1, nannihilators));
  const auto n = std::max(ncreators, nannihilators);
  if (n == 0) return std::nullopt;
  return left_to_right(1, n);
}

std::wstring CouplingScheme::to_wstring() const {
  if (is_leaf()) return std::to_wstring(leaf_);
  return L"(" + left_->to_wstring() + L", " + right_->to_wstring() + L")";
}

bool operator==(const CouplingScheme& s1, const CouplingScheme& s2) {
  if (s1.is_leaf() || s2.is_leaf())
    return s1.is_leaf() && s2.is_leaf() && s1.leaf_ == s2.leaf_;
  return *s1.left_ == *s2.left_ && *s1.right_ == *s2.right_;
}

TensorDeclaration::TensorDeclaration(std::wstring name, std::size_t ncreators,
                                     std::size_t nannihilators,
                                     Attributes attributes)
    : name_(std::move(name)),
      ncreators_(ncreators),
      nannihilators_(nannihilators),
      scalar_(attributes.scalar),
      reduce_(attributes.reduce || !attributes.scalar),
      diagonal_(attributes.diagonal),
      scheme_(std::move(attributes.scheme)) {
  if (diagonal_) {
    if (scheme_)
      throw std::invalid_argument(std::format(
          "TensorDeclaration: diagonal tensor {} cannot have a coupling "
          "scheme",
          to_string(name_)));
    if (total_mode() % 2 != 0)
      throw std::invalid_argument(std::format(
          "TensorDeclaration: diagonal tensor {} needs an even mode",
          to_string(name_)));
    return;
  }

  if (scheme_)
    scheme_->validate(total_mode());
  else
    scheme_ = CouplingScheme::make_default(ncreators_, nannihilators_);

  if (scheme_ && scheme_->is_leaf())
    throw std::invalid_argument(std::format(
        "TensorDeclaration: the scheme of tensor {} couples a single slot",
        to_string(name_)));
}

std::wstring TensorDeclaration::to_wstring() const {
  return std::format(
      L"Tensor {} {{mode=({}, {}), scalar={}, reduce={}, diagonal={}, "
      L"scheme={}}}",
      name_, ncreators_, nannihilators_, scalar_, reduce_, diagonal_,
      scheme_ ? scheme_->to_wstring() : std::wstring(L"()"));
}

Variable::Variable(TensorPtr tensor, container::vector<Index> subscripts)
    : tensor_(std::move(tensor)), subscripts_(std::move(subscripts)) {
  if (!tensor_) throw std::invalid_argument("Variable: null tensor");
  if (subscripts_.size() != tensor_->nsubscripts())
    throw std::invalid_argument(std::format(
        "Variable: expected {} subscripts on tensor {}, got {}",
        tensor_->nsubscripts(), to_string(tensor_->name()),
        subscripts_.size()));
}

const Index& Variable::subscript(int slot) const {
  return subscripts_.at(static_cast<std::size_t>(std::abs(slot)) - 1);
}

container::set<Index> Variable::depends_on() const {
  return container::set<Index>(subscripts_.begin(), subscripts_.end());
}

std::wstring Variable::to_wstring() const {
  std::wstring result = tensor_->name() + L"_{";
  for (std::size_t k = 0; k != subscripts_.size(); ++k) {
    if (k != 0) result += L" ";
    result += subscripts_[k].label();
  }
  return result + L"}";
}

ReducedVariable::ReducedVariable(Variable variable,
                                 container::vector<Index> labels)
    : variable_(std::move(variable)), labels_(std::move(labels)) {
  const auto& scheme = variable_.tensor().scheme();
  const std::size_t expected = scheme ? scheme->ncouplings() : 1;
  if (labels_.size() != expected)
    throw std::invalid_argument(std::format(
        "ReducedVariable: expected {} coupling labels on tensor {}, got {}",
        expected, to_string(variable_.tensor().name()), labels_.size()));
}

std::wstring ReducedVariable::to_wstring() const {
  std::wstring result = variable_.to_wstring() + L"^{";
  for (std::size_t k = 0; k != labels_.size(); ++k) {
    if (k != 0) result += L" ";
    result += labels_[k].label();
  }
  return result + L"}";
}

}  // namespace amc
