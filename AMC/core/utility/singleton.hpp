#ifndef AMC_CORE_UTILITY_SINGLETON_HPP
#define AMC_CORE_UTILITY_SINGLETON_HPP

#include <memory>
#include <mutex>
#include <stdexcept>
#include <type_traits>

namespace amc {

// clang-format off
/// @brief CRTP base for process-wide objects such as the Logger
///
/// Usage:
/// \code
/// class A : public Singleton<A> {
///   private:
///     friend class Singleton<A>;
///     A(int verbosity = 0);
/// };
/// A::set_instance(1);      // optional, call-once; otherwise the first instance() default-constructs
/// A& a = A::instance();
/// \endcode
// clang-format on
template <typename Derived>
class Singleton {
  template <typename T, typename Enabler = void>
  struct default_constructible : public std::false_type {};
  template <typename T>
  struct default_constructible<T, std::void_t<decltype(T{})>>
      : public std::true_type {};

 public:
  /// @return reference to the instance
  /// @throw std::logic_error if Derived is not default-constructible and
  /// set_instance() has not been called
  static Derived& instance() {
    if (auto* ptr = accessor().get()) return *ptr;
    if constexpr (default_constructible<Derived>::value) {
      std::scoped_lock lock(mutex());
      if (!accessor()) accessor().reset(new Derived);
      return *accessor();
    } else
      throw std::logic_error(
          "amc::Singleton::instance: set_instance() has not been called");
  }

  /// constructs the instance from @p args
  /// @throw std::logic_error if the instance already exists
  template <typename... Args>
  static Derived& set_instance(Args&&... args) {
    std::scoped_lock lock(mutex());
    if (accessor())
      throw std::logic_error(
          "amc::Singleton::set_instance: instance already exists");
    accessor().reset(new Derived(std::forward<Args>(args)...));
    return *accessor();
  }

 protected:
  Singleton() = default;

 private:
  static std::unique_ptr<Derived>& accessor() {
    static std::unique_ptr<Derived> instance;
    return instance;
  }
  static std::mutex& mutex() {
    static std::mutex mtx;
    return mtx;
  }
};

}  // namespace amc

#endif  // AMC_CORE_UTILITY_SINGLETON_HPP
