#include <cmath>
#include <numbers>
#include <markov/core/errors.hpp>
#include <markov/log/logger.hpp>
#include <markov/sample/proposal.hpp>

namespace markov::sample {

NormalJump::NormalJump(double loc, double scale) : loc_(loc), scale_(scale) {
  if (!std::isfinite(loc) || !(scale > 0.0) || !std::isfinite(scale)) {
    MLOG_ERROR("NormalJump: invalid parameters loc={}, scale={}", loc, scale);
    throw ConfigurationError("NormalJump: scale must be finite and > 0");
  }
}

double NormalJump::sample(Rng &rng) const {
  return rng.normal(loc_, scale_);
}

double NormalJump::pdf(double x) const {
  const double z = (x - loc_) / scale_;
  return std::exp(-0.5 * z * z) / (scale_ * std::sqrt(2.0 * std::numbers::pi));
}

UniformJump::UniformJump(double lo, double hi) : lo_(lo), hi_(hi) {
  if (!std::isfinite(lo) || !std::isfinite(hi) || !(lo < hi)) {
    MLOG_ERROR("UniformJump: invalid bounds [{}, {}]", lo, hi);
    throw ConfigurationError("UniformJump: bounds must be finite with lo < hi");
  }
}

double UniformJump::sample(Rng &rng) const {
  return lo_ + (hi_ - lo_) * rng.uniform();
}

double UniformJump::pdf(double x) const {
  if (x < lo_ || x > hi_)
    return 0.0;
  return 1.0 / (hi_ - lo_);
}

std::shared_ptr<const JumpDistribution> default_jump() {
  return std::make_shared<NormalJump>(0.0, 0.2);
}

} // namespace markov::sample
