#pragma once
#include <memory>
#include <markov/math/rng.hpp>

namespace markov::sample {

using markov::math::Rng;

// Distribution of the random-walk increment added to the current state.
class JumpDistribution {
public:
  virtual ~JumpDistribution() = default;
  virtual double sample(Rng &rng) const = 0;
  virtual double pdf(double x) const = 0;
};

class NormalJump : public JumpDistribution {
public:
  NormalJump(double loc, double scale);
  double sample(Rng &rng) const override;
  double pdf(double x) const override;

  double loc() const { return loc_; }
  double scale() const { return scale_; }

private:
  double loc_;
  double scale_;
};

class UniformJump : public JumpDistribution {
public:
  UniformJump(double lo, double hi);
  double sample(Rng &rng) const override;
  double pdf(double x) const override;

private:
  double lo_;
  double hi_;
};

// N(0, 0.2), the increment used when none is configured.
std::shared_ptr<const JumpDistribution> default_jump();

} // namespace markov::sample
