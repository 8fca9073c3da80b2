#ifndef AMC_CORE_RUNTIME_HPP
#define AMC_CORE_RUNTIME_HPP

namespace amc {

/// sets the global locale, and the locale of the standard streams, to
/// C.UTF-8 if available, so that labels like λ0 in the log print correctly
void set_locale();

}  // namespace amc

#endif  // AMC_CORE_RUNTIME_HPP
