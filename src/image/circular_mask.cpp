/**
 * @file circular_mask.cpp
 * @brief Circular crop implementation
 */

#include "image/circular_mask.hpp"
#include "image/codec.hpp"

#include <algorithm>
#include <cmath>
#include <system_error>

namespace PosterEngine {

Result<ImageBuffer> circular_crop(const ImageBuffer &src, uint32_t size,
                                  Stage stage) {
  auto resized = Codec::resize(src, size, size, stage);
  if (!resized) {
    return std::move(resized.error());
  }
  ImageBuffer out = std::move(*resized);
  if (out.empty()) {
    return out;
  }

  const float radius = size / 2.0f;
  const float cx = radius;
  const float cy = radius;
  // Fully covered core; never smaller than the centre pixels of a 2x2 crop
  const float solid = std::max(radius - 1.0f, 0.75f);

  for (uint32_t y = 0; y < size; ++y) {
    for (uint32_t x = 0; x < size; ++x) {
      float dx = (x + 0.5f) - cx;
      float dy = (y + 0.5f) - cy;
      float dist = std::sqrt(dx * dx + dy * dy);

      // 1 inside the core, fading to 0 at radius
      float coverage =
          dist <= solid ? 1.0f : std::clamp(radius - dist, 0.0f, 1.0f);

      uint8_t *p = out.pixel(x, y);
      p[3] = static_cast<uint8_t>(std::lround(p[3] * coverage));
    }
  }

  return out;
}

Result<ImageBuffer> circular_crop_file(const std::filesystem::path &path,
                                       uint32_t size, Stage stage) {
  auto decoded = Codec::decode_file(path, stage);
  if (!decoded) {
    return std::move(decoded.error());
  }
  return circular_crop(*decoded, size, stage);
}

Result<std::filesystem::path>
process_circular_image(const std::filesystem::path &input,
                       const std::filesystem::path &output, uint32_t size) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(input, ec)) {
    return PosterError::input(input.string(), "input image does not exist");
  }
  if (size == 0) {
    return PosterError::input("size", "circle size must be positive");
  }

  auto cropped = circular_crop_file(input, size);
  if (!cropped) {
    return std::move(cropped.error());
  }

  auto png = Codec::encode_png(*cropped);
  if (!png) {
    return std::move(png.error());
  }
  return Codec::write_file_atomic(output, *png);
}

} // namespace PosterEngine
