#include <cmath>
#include <markov/core/errors.hpp>
#include <markov/log/logger.hpp>
#include <markov/math/vec.hpp>
#include <stdexcept>

namespace markov::math {

Matrix Matrix::identity(std::size_t n) {
  Matrix I(n, n);
  for (std::size_t i = 0; i < n; ++i)
    I(i, i) = 1.0;
  return I;
}

double &Matrix::operator()(std::size_t i, std::size_t j) {
  if (i >= rows || j >= cols) {
    MLOG_ERROR("Matrix index ({}, {}) out of range for {}x{}", i, j, rows, cols);
    throw std::out_of_range("Matrix index out of range");
  }
  return data[i * cols + j];
}

const double &Matrix::operator()(std::size_t i, std::size_t j) const {
  if (i >= rows || j >= cols) {
    MLOG_ERROR("Matrix index ({}, {}) out of range for {}x{}", i, j, rows, cols);
    throw std::out_of_range("Matrix index out of range");
  }
  return data[i * cols + j];
}

double dot(const Vector &a, const Vector &b) {
  if (a.size() != b.size())
    throw DimensionError("dot: vectors differ in dimension");
  double s = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i)
    s += a[i] * b[i];
  return s;
}

double norm2(const Vector &v) {
  return dot(v, v);
}

void axpy(double a, const Vector &x, Vector &y) {
  if (x.size() != y.size())
    throw DimensionError("axpy: vectors differ in dimension");
  for (std::size_t i = 0; i < x.size(); ++i)
    y[i] += a * x[i];
}

Matrix cholesky(const Matrix &A) {
  if (A.rows != A.cols) {
    MLOG_ERROR("cholesky: matrix is {}x{}, expected square", A.rows, A.cols);
    throw DimensionError("cholesky: matrix must be square");
  }

  const std::size_t n = A.rows;
  Matrix L(n, n);

  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t j = 0; j < i; ++j) {
      if (std::abs(A(i, j) - A(j, i)) > 1e-12 * (1.0 + std::abs(A(i, j))))
        throw DimensionError("cholesky: matrix must be symmetric");
    }
  }

  for (std::size_t j = 0; j < n; ++j) {
    double diag = A(j, j);
    for (std::size_t k = 0; k < j; ++k)
      diag -= L(j, k) * L(j, k);

    if (!(diag > 0.0))
      throw DimensionError("cholesky: matrix must be positive definite");

    L(j, j) = std::sqrt(diag);

    for (std::size_t i = j + 1; i < n; ++i) {
      double s = A(i, j);
      for (std::size_t k = 0; k < j; ++k)
        s -= L(i, k) * L(j, k);
      L(i, j) = s / L(j, j);
    }
  }

  return L;
}

} // namespace markov::math
