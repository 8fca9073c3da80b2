#include <AMC/yutsis/idx.hpp>

#include <AMC/yutsis/exception.hpp>

#include <format>
#include <string>
#include <utility>

namespace amc::yutsis {

Idx::Idx(JType type, std::wstring label, Properties properties)
    : type(type),
      label(std::move(label)),
      is_particle(properties.is_particle),
      zero(properties.zero),
      external(properties.external),
      rank(properties.rank) {}

void Idx::simplify() {
  if (zero) set_default();

  if (type == JType::Integer) {
    jphase = detail::floor_mod(jphase, 2);
    mphase = detail::floor_mod(mphase, 2);
  } else {
    jphase = detail::floor_mod(jphase, 4);
    if (jphase >= 2) {
      jphase -= 2;
      sign = -sign;
    }
    mphase = detail::floor_mod(mphase, 4);
    if (mphase >= 2) {
      mphase -= 2;
      sign = -sign;
    }
  }
}

void Idx::set_default() {
  jphase = 0;
  mphase = 0;
  sign = 1;
  jhat = 0;
}

void Idx::absorb(Idx& other) {
  sign *= other.sign;
  jphase += other.jphase;
  mphase += other.mphase;
  jhat += other.jhat;
  other.set_default();
}

std::wstring Idx::to_wstring() const {
  return std::format(
      L"index {} sign={:2} phase=(-1)^{{{:2}j + {:2}m}} jhat={:2} type={:>4} "
      L"zero={} external={}",
      label, sign, jphase, mphase, jhat, amc::to_wstring(type), zero,
      external);
}

IdxId IdxArena::make(JType type, Idx::Properties properties) {
  auto& counter =
      type == JType::Integer ? next_integer_ : next_half_integer_;
  auto label = (type == JType::Integer ? L"J" : L"j") +
               std::to_wstring(counter++);
  return make(type, std::move(label), properties);
}

IdxId IdxArena::make(JType type, std::wstring label,
                     Idx::Properties properties) {
  indices_.emplace_back(type, std::move(label), properties);
  return IdxId{indices_.size() - 1};
}

void IdxArena::check(IdxId id) const {
  if (id.value >= indices_.size())
    throw InvariantViolation("IdxArena: index handle " +
                             std::to_string(id.value) + " out of range");
}

Idx& IdxArena::operator[](IdxId id) {
  check(id);
  return indices_[id.value];
}

const Idx& IdxArena::operator[](IdxId id) const {
  check(id);
  return indices_[id.value];
}

IdxId IdxArena::root(IdxId id) const {
  const auto& idx = (*this)[id];
  return idx.constrained_to ? *idx.constrained_to : id;
}

void IdxArena::set_constraint(IdxId from, IdxId to) {
  auto& target = (*this)[to];
  auto& source = (*this)[from];
  if (from == to) return;
  if (source.type != target.type)
    throw InvariantViolation(
        "IdxArena::set_constraint: indices must have the same type");
  if (target.constrained_to)
    throw InvariantViolation(
        "IdxArena::set_constraint: target index is itself constrained");

  target.absorb(source);
  source.constrained_to = to;

  // path compression
  for (auto& idx : indices_) {
    if (idx.constrained_to == from) idx.constrained_to = to;
  }
}

JType IdxArena::coupled_type(IdxId id1, IdxId id2) const {
  return amc::coupled_type((*this)[id1].type, (*this)[id2].type);
}

}  // namespace amc::yutsis
