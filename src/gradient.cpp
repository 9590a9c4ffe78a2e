#include <cmath>
#include <utility>
#include <markov/core/errors.hpp>
#include <markov/math/gradient.hpp>

namespace markov::math {

GradientFn central_difference(PotentialFn U, double h) {
  if (!U)
    throw ConfigurationError("central_difference: potential must be a function");
  if (!(h > 0.0) || !std::isfinite(h))
    throw ConfigurationError("central_difference: step must be finite and > 0");

  return [U = std::move(U), h](const Vector &q) {
    Vector g(q.size());
    Vector x = q;
    for (std::size_t i = 0; i < q.size(); ++i) {
      x[i] = q[i] + h;
      const double up = U(x);
      x[i] = q[i] - h;
      const double down = U(x);
      x[i] = q[i];
      g[i] = (up - down) / (2.0 * h);
    }
    return g;
  };
}

} // namespace markov::math
