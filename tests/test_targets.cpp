#include <cmath>
#include <gtest/gtest.h>
#include <markov/core/errors.hpp>
#include <markov/sample/targets.hpp>

using namespace markov::sample;
using markov::math::Vector;

namespace {

double integrate(const DensityFn &f, double a, double b, int n) {
  const double h = (b - a) / n;
  double s = 0.5 * (f(a) + f(b));
  for (int i = 1; i < n; ++i)
    s += f(a + i * h);
  return s * h;
}

} // namespace

TEST(Targets, UniformPdf) {
  auto f = uniform_pdf(0.0, 2.0);
  EXPECT_DOUBLE_EQ(f(1.0), 0.5);
  EXPECT_DOUBLE_EQ(f(-0.1), 0.0);
  EXPECT_DOUBLE_EQ(f(2.1), 0.0);
  EXPECT_THROW(uniform_pdf(1.0, 1.0), markov::ConfigurationError);
}

TEST(Targets, BetaPdfNormalised) {
  auto f = beta_pdf(15.0, 7.0);
  EXPECT_NEAR(integrate(f, 0.0, 1.0, 20000), 1.0, 1e-6);
  EXPECT_DOUBLE_EQ(f(-0.5), 0.0);
  EXPECT_DOUBLE_EQ(f(0.0), 0.0);
}

TEST(Targets, GammaPdfShiftedSupport) {
  auto f = gamma_pdf(2.0, 4.0, 5.0);
  EXPECT_DOUBLE_EQ(f(3.0), 0.0);
  EXPECT_DOUBLE_EQ(f(4.0), 0.0);
  EXPECT_NEAR(integrate(f, 4.0, 304.0, 60000), 1.0, 1e-6);

  auto xf = [&f](double x) { return x * f(x); };
  EXPECT_NEAR(integrate(xf, 4.0, 304.0, 60000), 14.0, 1e-4);

  EXPECT_THROW(gamma_pdf(0.0, 0.0, 1.0), markov::ConfigurationError);
}

TEST(Targets, NormalPdfPeak) {
  auto f = normal_pdf(1.0, 0.5);
  EXPECT_NEAR(f(1.0), 0.7978845608028654, 1e-12);
  EXPECT_NEAR(f(0.0), f(2.0), 1e-15);
}

TEST(Targets, GaussianPotentialAndGradient) {
  auto U = gaussian_potential({1.0, -2.0}, {2.0, 0.5});
  auto g = gaussian_gradient({1.0, -2.0}, {2.0, 0.5});

  EXPECT_DOUBLE_EQ(U({1.0, -2.0}), 0.0);
  EXPECT_DOUBLE_EQ(U({2.0, 0.0}), 0.5 * (2.0 * 1.0 + 0.5 * 4.0));

  Vector grad = g({2.0, 0.0});
  EXPECT_DOUBLE_EQ(grad[0], 2.0);
  EXPECT_DOUBLE_EQ(grad[1], 1.0);

  auto numeric = markov::math::central_difference(U);
  Vector ng = numeric({2.0, 0.0});
  EXPECT_NEAR(ng[0], 2.0, 1e-6);
  EXPECT_NEAR(ng[1], 1.0, 1e-6);

  EXPECT_THROW(U({1.0}), markov::DimensionError);
  EXPECT_THROW(gaussian_potential({0.0}, {0.0}), markov::ConfigurationError);
  EXPECT_THROW(gaussian_gradient({0.0, 1.0}, {1.0}), markov::DimensionError);
}

TEST(Targets, CentralDifferenceRejectsBadStep) {
  auto U = [](const Vector &q) { return q[0] * q[0]; };
  EXPECT_THROW(markov::math::central_difference(U, 0.0), markov::ConfigurationError);
  EXPECT_THROW(markov::math::central_difference(nullptr), markov::ConfigurationError);
}
