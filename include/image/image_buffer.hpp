#pragma once
/**
 * @file image_buffer.hpp
 * @brief RGBA raster buffer and compositing primitives
 */

#include "core/color.hpp"

#include <cstdint>
#include <glm/glm.hpp>
#include <vector>

namespace PosterEngine {

/// RGBA image buffer (8 bits per channel, row-major, unpremultiplied)
struct ImageBuffer {
  std::vector<uint8_t> data;
  uint32_t width = 0;
  uint32_t height = 0;
  uint32_t channels = 4; // RGBA

  /// Create transparent buffer with dimensions
  static ImageBuffer create(uint32_t w, uint32_t h);

  /// Create buffer filled with a color
  static ImageBuffer filled(uint32_t w, uint32_t h, Color::RGBA color);

  [[nodiscard]] bool empty() const { return width == 0 || height == 0; }

  /// Get pixel at (x, y), nullptr when out of bounds
  [[nodiscard]] uint8_t *pixel(uint32_t x, uint32_t y);
  [[nodiscard]] const uint8_t *pixel(uint32_t x, uint32_t y) const;

  /// Read pixel as color (transparent when out of bounds)
  [[nodiscard]] Color::RGBA at(uint32_t x, uint32_t y) const;

  /// Fill with color
  void fill(Color::RGBA color);

  /// Blend color over the pixel at (x, y); ignores out-of-bounds
  void blend_pixel(int x, int y, Color::RGBA color);

  /// Blend a filled rectangle; clipped to the buffer
  void fill_rect(glm::ivec2 origin, glm::ivec2 size, Color::RGBA color);

  /**
   * @brief Composite another buffer over this one ("over" operator)
   * @param src Layer to draw
   * @param origin Top-left position of src in this buffer (may be negative)
   */
  void composite(const ImageBuffer &src, glm::ivec2 origin);

  /// Replace every pixel with itself blended over an opaque background
  void flatten(Color::RGBA background);
};

} // namespace PosterEngine
