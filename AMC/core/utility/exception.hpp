#ifndef AMC_CORE_UTILITY_EXCEPTION_HPP
#define AMC_CORE_UTILITY_EXCEPTION_HPP

#include <exception>
#include <string>

namespace amc {

/// basic AMC exception
/// @sa AMC_ASSERT
class Exception : public std::exception {
 public:
  Exception(const std::string& str) : msg_(str) {}
  virtual const char* what() const noexcept { return msg_.data(); }

 private:
  std::string msg_;
};  // class Exception

}  // namespace amc

#endif  // AMC_CORE_UTILITY_EXCEPTION_HPP
