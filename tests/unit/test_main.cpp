#define CATCH_CONFIG_RUNNER
#include <catch2/catch_session.hpp>
#include <catch2/catch_test_macros.hpp>

#include "catch2_amc.hpp"

#include <AMC/core/logger.hpp>
#include <AMC/core/runtime.hpp>

int main(int argc, char* argv[]) {
  using namespace amc;

  Catch::Session session;

  // global setup...
  amc::set_locale();
  // uncomment to enable verbose output ...
  // Logger::set_instance(1);
  // ... or can instead selectively set/unset particular logging flags
  // Logger::instance().yutsis_reduce = true;

  int result = session.run(argc, argv);

  return result;
}
