#ifndef AMC_CORE_CONTEXT_HPP
#define AMC_CORE_CONTEXT_HPP

#include <cstddef>
#include <optional>
#include <string>

namespace amc {

/// placement of the hat factor of the Wigner-Eckart theorem
enum class WETConvention {
  /// \f$ \langle j m | T^\lambda_\mu | j' m' \rangle = (-1)^{2\lambda}
  /// \hat{j}^{-1} C^{j m}_{j' m' \lambda \mu} \langle j || T^\lambda || j'
  /// \rangle \f$
  Wigner,
  /// \f$ \langle j m | T^\lambda_\mu | j' m' \rangle = \hat{j'}^{-1} C^{j
  /// m}_{j' m' \lambda \mu} \langle j || T^\lambda || j' \rangle \f$
  Sakurai
};

std::wstring to_wstring(WETConvention c);

// clang-format off
/// @brief Specifies how angular-momentum reductions are carried out
///
/// - `convention`: the Wigner-Eckart convention used for reduced matrix elements; the two are not numerically
///   interchangeable without the corresponding hat offset
/// - `collect_ninejs`: whether sums over products of three 6j-symbols sharing a square index are factorized into 9j-symbols
/// - `collect_twelvejfirsts`: whether sums over a 9j-symbol and two 6j-symbols are factorized into 12j-symbols of the first kind;
///   only useful together with `collect_ninejs`
/// - `max_reduction_iterations`: the maximum number of rule applications per connected Yutsis graph
/// - `max_zero_line_iterations`: the maximum number of sweeps of the zero-line fixed point
// clang-format on
class Context {
 public:
  struct Defaults {
    constexpr static auto convention = WETConvention::Wigner;
    constexpr static bool collect_ninejs = false;
    constexpr static bool collect_twelvejfirsts = false;
    constexpr static std::size_t max_reduction_iterations = 100;
    constexpr static std::size_t max_zero_line_iterations = 100;
  };

  /// helper for the named-parameter constructor of Context
  struct Options {
    WETConvention convention = Defaults::convention;
    bool collect_ninejs = Defaults::collect_ninejs;
    bool collect_twelvejfirsts = Defaults::collect_twelvejfirsts;
    std::size_t max_reduction_iterations = Defaults::max_reduction_iterations;
    std::size_t max_zero_line_iterations = Defaults::max_zero_line_iterations;
  };

  /// @brief standard named-parameter constructor
  ///
  /// Example:
  /// ```cpp
  ///   Context ctx({.convention = WETConvention::Sakurai, .collect_ninejs = true});
  /// ```
  Context(Options options = {});

  ~Context() = default;
  Context(const Context&) = default;
  Context(Context&&) = default;
  Context& operator=(const Context&) = default;
  Context& operator=(Context&&) = default;

  WETConvention convention() const;
  bool collect_ninejs() const;
  bool collect_twelvejfirsts() const;
  std::size_t max_reduction_iterations() const;
  std::size_t max_zero_line_iterations() const;

 private:
  WETConvention convention_ = Defaults::convention;
  bool collect_ninejs_ = Defaults::collect_ninejs;
  bool collect_twelvejfirsts_ = Defaults::collect_twelvejfirsts;
  std::size_t max_reduction_iterations_ = Defaults::max_reduction_iterations;
  std::size_t max_zero_line_iterations_ = Defaults::max_zero_line_iterations;
};

bool operator==(const Context& ctx1, const Context& ctx2);
bool operator!=(const Context& ctx1, const Context& ctx2);

/// @return the default context used by reduce_term() and reduce_equation()
const Context& get_default_context();

/// sets the default context
void set_default_context(const Context& ctx);

/// resets the default context to Context{}
void reset_default_context();

/// @brief makes a context the default one for the lifetime of this object
///
/// The context that was the default on construction is restored on
/// destruction; nothing is restored if it equaled the new one.
class ScopedDefaultContext {
 public:
  explicit ScopedDefaultContext(const Context& ctx);
  ~ScopedDefaultContext();

  ScopedDefaultContext(const ScopedDefaultContext&) = delete;
  ScopedDefaultContext& operator=(const ScopedDefaultContext&) = delete;

 private:
  std::optional<Context> previous_;
};

/// @brief changes the default context for the current scope
/// Example:
/// ```cpp
///   auto resetter = set_scoped_default_context(Context({.collect_ninejs = true}));
/// ```
[[nodiscard]] ScopedDefaultContext set_scoped_default_context(
    const Context& ctx);

}  // namespace amc

#endif  // AMC_CORE_CONTEXT_HPP
