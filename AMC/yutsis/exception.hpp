#ifndef AMC_YUTSIS_EXCEPTION_HPP
#define AMC_YUTSIS_EXCEPTION_HPP

#include <AMC/core/utility/exception.hpp>

#include <string>

namespace amc {

/// thrown when a reduction step finds the coupling network in a state that a
/// correct construction cannot produce; such a term must not be retried
class InvariantViolation : public Exception {
 public:
  InvariantViolation(const std::string& str)
      : Exception("amc::InvariantViolation: " + str) {}
};

/// thrown when the Yutsis graph cannot be brought to zero nodes by the
/// implemented rules (its topology is beyond "square"); this is a limitation
/// of the algorithm, the caller may try another permutation of the term
class GraphNotReducible : public Exception {
 public:
  GraphNotReducible(const std::string& str)
      : Exception("amc::GraphNotReducible: " + str) {}
};

}  // namespace amc

#endif  // AMC_YUTSIS_EXCEPTION_HPP
