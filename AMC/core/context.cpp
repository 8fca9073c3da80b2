#include <AMC/core/context.hpp>

namespace amc {

std::wstring to_wstring(WETConvention c) {
  switch (c) {
    case WETConvention::Wigner:
      return L"wigner";
    case WETConvention::Sakurai:
      return L"sakurai";
  }
  return L"unknown";
}

Context::Context(Options options)
    : convention_(options.convention),
      collect_ninejs_(options.collect_ninejs),
      collect_twelvejfirsts_(options.collect_twelvejfirsts),
      max_reduction_iterations_(options.max_reduction_iterations),
      max_zero_line_iterations_(options.max_zero_line_iterations) {}

WETConvention Context::convention() const { return convention_; }

bool Context::collect_ninejs() const { return collect_ninejs_; }

bool Context::collect_twelvejfirsts() const { return collect_twelvejfirsts_; }

std::size_t Context::max_reduction_iterations() const {
  return max_reduction_iterations_;
}

std::size_t Context::max_zero_line_iterations() const {
  return max_zero_line_iterations_;
}

bool operator==(const Context& ctx1, const Context& ctx2) {
  if (&ctx1 == &ctx2)
    return true;
  else
    return ctx1.convention() == ctx2.convention() &&
           ctx1.collect_ninejs() == ctx2.collect_ninejs() &&
           ctx1.collect_twelvejfirsts() == ctx2.collect_twelvejfirsts() &&
           ctx1.max_reduction_iterations() == ctx2.max_reduction_iterations() &&
           ctx1.max_zero_line_iterations() == ctx2.max_zero_line_iterations();
}

bool operator!=(const Context& ctx1, const Context& ctx2) {
  return !(ctx1 == ctx2);
}

namespace {

Context& default_context() {
  static Context instance;
  return instance;
}

}  // namespace

const Context& get_default_context() { return default_context(); }

void set_default_context(const Context& ctx) { default_context() = ctx; }

void reset_default_context() { default_context() = Context{}; }

ScopedDefaultContext::ScopedDefaultContext(const Context& ctx) {
  if (default_context() != ctx) {
    previous_ = default_context();
    default_context() = ctx;
  }
}

ScopedDefaultContext::~ScopedDefaultContext() {
  if (previous_) default_context() = *previous_;
}

ScopedDefaultContext set_scoped_default_context(const Context& ctx) {
  return ScopedDefaultContext(ctx);
}

}  // namespace amc
