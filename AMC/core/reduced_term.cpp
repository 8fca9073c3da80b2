#include <AMC/core/reduced_term.hpp>
#include <AMC/core/term.hpp>

#include <cstddef>
#include <format>

namespace amc {

namespace {

template <std::size_t N>
std::wstring labels_to_wstring(const std::array<Index, N>& indices,
                               std::size_t row_length) {
  std::wstring result;
  for (std::size_t k = 0; k != N; ++k) {
    if (k != 0) result += k % row_length == 0 ? L"; " : L" ";
    result += indices[k].label();
  }
  return result;
}

/// folds a phase exponent of a half-integer angular momentum to {0, 1}
int fold_half_integer_phase(int phase, int& sign) {
  phase = detail::floor_mod(phase, 4);
  if (phase >= 2) {
    phase -= 2;
    sign = -sign;
  }
  return phase;
}

}  // namespace

std::wstring DeltaJ::to_wstring() const {
  return L"δ_{" + first.label() + L" " + second.label() + L"}";
}

std::wstring HatPhaseFactor::to_wstring() const {
  auto coefficient = [](int c) {
    return c == 1 ? std::wstring() : std::to_wstring(c);
  };

  std::wstring result;
  if (jphase != 0 || mphase != 0) {
    result += L"(-1)^{";
    if (jphase != 0) result += coefficient(jphase) + index.label();
    if (mphase != 0) {
      if (jphase != 0) result += L" + ";
      result += coefficient(mphase) + L"m_" + index.label();
    }
    result += L"}";
  }
  if (hatpower != 0) {
    if (!result.empty()) result += L" ";
    result += L"hat(" + index.label() + L")";
    if (hatpower != 1) result += std::format(L"^{}", hatpower);
  }
  return result;
}

std::optional<HatPhaseFactor> make_hat_phase_factor(const Index& index,
                                                    int hatpower, int jphase,
                                                    int mphase, int& sign) {
  if (index.type() == JType::Integer) {
    jphase = detail::floor_mod(jphase, 2);
    mphase = detail::floor_mod(mphase, 2);
  } else {
    jphase = fold_half_integer_phase(jphase, sign);
    mphase = fold_half_integer_phase(mphase, sign);
  }
  if (hatpower == 0 && jphase == 0 && mphase == 0) return std::nullopt;
  return HatPhaseFactor{index, hatpower, jphase, mphase};
}

std::wstring TriangularDeltaJ::to_wstring() const {
  return L"{" + labels_to_wstring(indices, 3) + L"}";
}

std::wstring SixJSymbol::to_wstring() const {
  return L"SixJ(" + labels_to_wstring(indices, 3) + L")";
}

std::wstring NineJSymbol::to_wstring() const {
  return L"NineJ(" + labels_to_wstring(indices, 3) + L")";
}

std::wstring TwelveJFirstSymbol::to_wstring() const {
  return L"TwelveJFirst(" + labels_to_wstring(indices, 4) + L")";
}

std::wstring ReducedTerm::to_wstring() const {
  std::wstring result = amc::to_wstring(prefactor) + L" " +
                        detail::summation_to_wstring(summation);

  auto append = [&result](const auto& factors) {
    for (const auto& f : factors) {
      if (result.back() != L' ') result += L" ";
      result += f.to_wstring();
    }
  };
  append(deltas);
  append(diagonal_factors);
  append(hat_factors);
  append(triangular_deltas);
  append(sixjs);
  append(ninejs);
  append(twelvejfirsts);
  append(variables);

  for (const auto& [index, survivor] : constraints)
    result += L" [" + index.label() + L" = " + survivor.label() + L"]";
  return result;
}

std::wstring ReducedEquation::to_wstring() const {
  std::wstring result = lhs.to_wstring() + L" =";
  if (terms.empty()) return result + L" 0";
  for (std::size_t k = 0; k != terms.size(); ++k) {
    result += k == 0 ? L" " : L" + ";
    result += terms[k].to_wstring();
  }
  return result;
}

}  // namespace amc
