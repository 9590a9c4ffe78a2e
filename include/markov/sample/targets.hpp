#pragma once
#include <functional>
#include <markov/math/gradient.hpp>

namespace markov::sample {

using DensityFn = std::function<double(double)>;

// Densities, zero outside their support.
DensityFn uniform_pdf(double a, double b);
DensityFn normal_pdf(double mu, double sigma);
DensityFn gamma_pdf(double shape, double loc, double scale);
DensityFn beta_pdf(double a, double b);

// U(q) = 0.5 * sum_i precision_i * (q_i - mean_i)^2, i.e. an axis-aligned
// Gaussian up to a constant.
math::PotentialFn gaussian_potential(math::Vector mean, math::Vector precision);
math::GradientFn gaussian_gradient(math::Vector mean, math::Vector precision);

} // namespace markov::sample
