#ifndef AMC_CORE_INDEX_HPP
#define AMC_CORE_INDEX_HPP

#include <AMC/core/jtype.hpp>

#include <compare>
#include <string>
#include <utility>

namespace amc {

/// what an Index labels
enum class IndexClass {
  /// a collective or coupled angular momentum, e.g. a tensor rank
  AngularMomentum,
  /// the angular momentum of a single-particle state
  Particle
};

/// @brief a named angular-momentum index of an algebraic expression
///
/// Indices are identified by their label; two Index objects with the same
/// label are the same index.
class Index {
 public:
  explicit Index(std::wstring label, JType type = JType::HalfInteger,
                 IndexClass index_class = IndexClass::Particle)
      : label_(std::move(label)), type_(type), index_class_(index_class) {}

  const std::wstring& label() const { return label_; }
  JType type() const { return type_; }
  IndexClass index_class() const { return index_class_; }
  bool is_particle() const { return index_class_ == IndexClass::Particle; }

  std::wstring to_wstring() const { return label_; }

  friend bool operator==(const Index& i1, const Index& i2) {
    return i1.label_ == i2.label_;
  }
  friend std::strong_ordering operator<=>(const Index& i1, const Index& i2) {
    return i1.label_.compare(i2.label_) <=> 0;
  }

 private:
  std::wstring label_;
  JType type_;
  IndexClass index_class_;
};

inline JType coupled_type(const Index& i1, const Index& i2) {
  return coupled_type(i1.type(), i2.type());
}

}  // namespace amc

#endif  // AMC_CORE_INDEX_HPP
