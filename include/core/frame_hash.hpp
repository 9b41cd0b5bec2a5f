#pragma once
/**
 * @file frame_hash.hpp
 * @brief Deterministic pixel hashing for output validation
 */

#include <cstdint>
#include <span>

namespace PosterEngine {

/// FNV-1a 64-bit hash of raw pixel bytes
[[nodiscard]] constexpr uint64_t
hash_pixels(std::span<const uint8_t> pixels) noexcept {
  constexpr uint64_t FNV_OFFSET = 14695981039346656037ULL;
  constexpr uint64_t FNV_PRIME = 1099511628211ULL;

  uint64_t hash = FNV_OFFSET;
  for (uint8_t byte : pixels) {
    hash ^= byte;
    hash *= FNV_PRIME;
  }
  return hash;
}

} // namespace PosterEngine
