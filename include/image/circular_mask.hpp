#pragma once
/**
 * @file circular_mask.hpp
 * @brief Circular crop for profile photos and avatars
 */

#include "core/result.hpp"
#include "image/image_buffer.hpp"

#include <filesystem>

namespace PosterEngine {

/**
 * @brief Resize to (size, size) and keep only the inscribed disc
 *
 * Pixels whose centre is at or beyond radius size/2 become fully
 * transparent. The edge is anti-aliased towards the inside only; the
 * centre pixels stay opaque even for one or two pixel crops.
 */
[[nodiscard]] Result<ImageBuffer> circular_crop(const ImageBuffer &src,
                                                uint32_t size,
                                                Stage stage = Stage::PhotoDecode);

/// Decode an image file and crop it; DecodeError tagged with `stage`
[[nodiscard]] Result<ImageBuffer>
circular_crop_file(const std::filesystem::path &path, uint32_t size,
                   Stage stage = Stage::PhotoDecode);

/// Crop an image file and write the result as PNG
[[nodiscard]] Result<std::filesystem::path>
process_circular_image(const std::filesystem::path &input,
                       const std::filesystem::path &output, uint32_t size);

} // namespace PosterEngine
