#include "ragsync/common/vector_math.hpp"

#include <cmath>

namespace ragsync::common {

namespace {

constexpr double kMinNorm = 1e-12;

} // namespace

double l2_norm(const float *values, const std::size_t size) {
  double sum = 0.0;
  for (std::size_t i = 0; i < size; ++i) {
    sum += static_cast<double>(values[i]) * static_cast<double>(values[i]);
  }
  return std::sqrt(sum);
}

bool l2_normalize(float *values, const std::size_t size) {
  const double norm = l2_norm(values, size);
  if (!std::isfinite(norm) || norm < kMinNorm) {
    return false;
  }
  for (std::size_t i = 0; i < size; ++i) {
    values[i] = static_cast<float>(static_cast<double>(values[i]) / norm);
  }
  return true;
}

bool l2_normalize(std::vector<float> &values) { return l2_normalize(values.data(), values.size()); }

float dot(const float *a, const float *b, const std::size_t size) {
  double sum = 0.0;
  for (std::size_t i = 0; i < size; ++i) {
    sum += static_cast<double>(a[i]) * static_cast<double>(b[i]);
  }
  return static_cast<float>(sum);
}

} // namespace ragsync::common
