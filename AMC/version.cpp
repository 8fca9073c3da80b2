#include <AMC/version.hpp>

namespace amc {

const char* revision() noexcept {
  static const char revision[] = AMC_GIT_REVISION;
  return revision;
}

const char* git_description() noexcept {
  static const char description[] = AMC_GIT_DESCRIPTION;
  return description;
}

}  // namespace amc
