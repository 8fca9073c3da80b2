#include <AMC/core/runtime.hpp>

#include <exception>
#include <iostream>
#include <locale>

namespace amc {

void set_locale() {
  std::locale target_locale{};
  try {  // use C.UTF-8, if supported
    target_locale = std::locale{"C.UTF-8"};
  } catch (std::exception&) {  // keep the default otherwise
  }
  std::locale::global(target_locale);
  std::ios_base::sync_with_stdio(false);
  std::cout.imbue(target_locale);
  std::cerr.imbue(target_locale);
  std::wcout.imbue(target_locale);
  std::wcerr.imbue(target_locale);
  std::ios_base::sync_with_stdio(true);
}

}  // namespace amc
