#ifndef AMC_CORE_UTILITY_MACROS_HPP
#define AMC_CORE_UTILITY_MACROS_HPP

#include <AMC/core/utility/exception.hpp>

#include <cstdlib>
#include <iostream>
#include <source_location>
#include <sstream>
#include <string>
#include <utility>

#define AMC_CONCAT_IMPL(x, y) x##y
/* "concats" x and y without a space in between */
#define AMC_CONCAT(x, y) AMC_CONCAT_IMPL(x, y)
#define AMC_STRINGIFY(x) #x

/* Defines the behavior of AMC_ASSERT, set by AMC_ASSERT_BEHAVIOR_ at configure
 * time */
#define AMC_ASSERT_THROW 2
#define AMC_ASSERT_ABORT 3
#define AMC_ASSERT_IGNORE 4
#ifndef AMC_ASSERT_BEHAVIOR_
#define AMC_ASSERT_BEHAVIOR_ THROW
#endif
#define AMC_ASSERT_BEHAVIOR AMC_CONCAT(AMC_ASSERT_, AMC_ASSERT_BEHAVIOR_)
#if AMC_ASSERT_BEHAVIOR != AMC_ASSERT_IGNORE
#define AMC_ASSERT_ENABLED
#endif

namespace amc {

#ifdef AMC_ASSERT_ENABLED
[[noreturn]]
#endif
inline void
assert_failed([[maybe_unused]] const std::string &errmsg,
              [[maybe_unused]] const std::source_location location =
                  std::source_location::current()) {
#ifdef AMC_ASSERT_ENABLED
#if AMC_ASSERT_BEHAVIOR == AMC_ASSERT_THROW
  std::ostringstream oss;
  oss
#elif AMC_ASSERT_BEHAVIOR == AMC_ASSERT_ABORT
  std::cerr
#endif
      << errmsg << " at " << location.file_name() << ":" << location.line()
      << " in function '" << location.function_name() << "'";
#if AMC_ASSERT_BEHAVIOR == AMC_ASSERT_THROW
  throw amc::Exception(oss.str());
#elif AMC_ASSERT_BEHAVIOR == AMC_ASSERT_ABORT
  std::abort();
#endif
#endif  // AMC_ASSERT_ENABLED
}

}  // namespace amc

#ifdef AMC_ASSERT_ENABLED
#define AMC_ASSERT_MESSAGE(EXPR, ...) \
  "AMC_ASSERT(" AMC_STRINGIFY(EXPR) ") failed" __VA_OPT__( \
      " with message '" __VA_ARGS__ "'")

#define AMC_ASSERT(EXPR, ...)                                    \
  do {                                                           \
    if (!(EXPR)) {                                               \
      amc::assert_failed(AMC_ASSERT_MESSAGE(EXPR, __VA_ARGS__)); \
    }                                                            \
  } while (0)
#else
#define AMC_ASSERT(...) \
  do {                  \
  } while (0)
#endif

#if defined(__cpp_lib_unreachable)
#define AMC_UNREACHABLE_TOKEN std::unreachable()
#elif defined(__GNUG__) || defined(__clang__)
#define AMC_UNREACHABLE_TOKEN __builtin_unreachable()
#else
#define AMC_UNREACHABLE_TOKEN std::abort()
#endif

#define AMC_UNREACHABLE                              \
  do {                                               \
    AMC_ASSERT(false && "reached unreachable code"); \
    AMC_UNREACHABLE_TOKEN;                           \
  } while (0)

#endif  // AMC_CORE_UTILITY_MACROS_HPP
