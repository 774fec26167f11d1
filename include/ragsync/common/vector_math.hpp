#pragma once

#include <cstddef>
#include <vector>

namespace ragsync::common {

[[nodiscard]] double l2_norm(const float *values, std::size_t size);

/// Scales `values` to unit length. Returns false and leaves them untouched when the norm is ~0.
bool l2_normalize(float *values, std::size_t size);
bool l2_normalize(std::vector<float> &values);

[[nodiscard]] float dot(const float *a, const float *b, std::size_t size);

} // namespace ragsync::common
