#ifndef AMC_LOGGER_HPP
#define AMC_LOGGER_HPP

#include <AMC/core/utility/singleton.hpp>

namespace amc {

/// controls logging within AMC components, only useful for
/// troubleshooting/learning
struct Logger : public Singleton<Logger> {
  bool zero_lines = false;
  bool canonicalize = false;
  bool yutsis_graph = false;
  bool yutsis_reduce = false;
  bool separation = false;
  bool collect_symbols = false;
  bool deltas = false;
  bool reduce_term = false;
  bool reduce_equation = false;

 private:
  friend class Singleton<Logger>;
  Logger(int log_level = 0) {
    if (log_level > 0) {
      zero_lines = true;
      canonicalize = true;
      yutsis_graph = true;
      yutsis_reduce = true;
      separation = true;
      collect_symbols = true;
      deltas = true;
      reduce_term = true;
      reduce_equation = true;
    }
  }
};

}  // namespace amc

#endif  // AMC_LOGGER_HPP
