#pragma once
#include <cstddef>
#include <vector>

namespace markov::math {

using Vector = std::vector<double>;

// Dense row-major matrix.
struct Matrix {
  std::size_t rows{0};
  std::size_t cols{0};
  std::vector<double> data;

  Matrix() = default;
  Matrix(std::size_t rows, std::size_t cols) : rows(rows), cols(cols) {
    data.resize(rows * cols, 0.0);
  }

  static Matrix identity(std::size_t n);

  double &operator()(std::size_t i, std::size_t j);
  const double &operator()(std::size_t i, std::size_t j) const;
};

double dot(const Vector &a, const Vector &b);
double norm2(const Vector &v);

// y += a * x
void axpy(double a, const Vector &x, Vector &y);

// Lower-triangular L with A = L * L^T. Throws DimensionError unless A is
// square, symmetric and positive definite.
Matrix cholesky(const Matrix &A);

} // namespace markov::math
