#pragma once

/** \file distance.hpp
 *  \brief Scalar reference kernels for cosine geometry (inner product, norm, cosine).
 *
 * Preconditions
 * - a.size() == b.size() > 0
 * - All inputs are finite
 * Zero-norm operands are defined rather than undefined: their cosine similarity is 0 and
 * their cosine distance is 1.
 * Determinism: pure functions, no allocations, no exceptions.
 */

#include <cmath>
#include <cstddef>
#include <span>

namespace ticketsim::kernels {

/** \brief Inner product: sum(a[i] * b[i]). O(d). */
inline float inner_product(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  // 4-way unrolled loop
  float s0 = 0.0f, s1 = 0.0f, s2 = 0.0f, s3 = 0.0f;
  std::size_t i = 0;

  const std::size_t unroll_end = n & ~std::size_t{3};
  for (; i < unroll_end; i += 4) {
    s0 += pa[i] * pb[i];
    s1 += pa[i+1] * pb[i+1];
    s2 += pa[i+2] * pb[i+2];
    s3 += pa[i+3] * pb[i+3];
  }

  float s = s0 + s1 + s2 + s3;
  for (; i < n; ++i) {
    s += pa[i] * pb[i];
  }
  return s;
}

/** \brief Euclidean norm ||a||. O(d). */
inline float l2_norm(std::span<const float> a) noexcept {
  return std::sqrt(inner_product(a, a));
}

/** \brief Scale a to unit length in place; a zero vector is left untouched. */
inline void normalize_in_place(std::span<float> a) noexcept {
  const float norm = l2_norm(a);
  if (norm <= 0.0f) return;
  const float inv = 1.0f / norm;
  for (float& x : a) x *= inv;
}

/** \brief Cosine similarity: (a·b) / (||a|| * ||b||), or 0 when either norm is 0. O(d). */
inline float cosine_similarity(std::span<const float> a, std::span<const float> b) noexcept {
  const float denom = l2_norm(a) * l2_norm(b);
  if (denom <= 0.0f) return 0.0f;
  return inner_product(a, b) / denom;
}

/** \brief Cosine distance defined as 1 - cosine_similarity(a,b). O(d). */
inline float cosine_distance(std::span<const float> a, std::span<const float> b) noexcept {
  return 1.0f - cosine_similarity(a, b);
}

/** \brief Cosine distance for operands already scaled to unit length (or zero). */
inline float unit_cosine_distance(std::span<const float> a, std::span<const float> b) noexcept {
  return 1.0f - inner_product(a, b);
}

} // namespace ticketsim::kernels
