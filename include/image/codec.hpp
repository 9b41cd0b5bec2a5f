#pragma once
/**
 * @file codec.hpp
 * @brief Image decode, resize, encode and output writing
 *
 * Thin wrappers over stb_image / stb_image_resize2 / stb_image_write that
 * report failures as stage-tagged PosterError values.
 */

#include "core/result.hpp"
#include "image/image_buffer.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace PosterEngine::Codec {

/// Decode any stb_image format (JPEG, PNG, BMP, ...) to RGBA
[[nodiscard]] Result<ImageBuffer> decode_file(const std::filesystem::path &path,
                                              Stage stage);

/// Decode an in-memory encoded image to RGBA
[[nodiscard]] Result<ImageBuffer> decode_memory(std::span<const uint8_t> bytes,
                                                Stage stage);

/// Largest pixel count a resize may produce
constexpr uint64_t MaxPixels = uint64_t{1} << 28;

/**
 * @brief Resample to exactly (w, h); alpha-weighted, linear color space
 *
 * Fails with a DecodeError tagged with `stage` when the target exceeds
 * MaxPixels or the resampler rejects the input.
 */
[[nodiscard]] Result<ImageBuffer> resize(const ImageBuffer &src, uint32_t w,
                                         uint32_t h, Stage stage);

/// Resample to a target width, height follows the aspect ratio (rounded)
[[nodiscard]] Result<ImageBuffer> resize_to_width(const ImageBuffer &src,
                                                  uint32_t target_width,
                                                  Stage stage);

/**
 * @brief Scale to fit inside a size x size square, centered on a background
 *
 * Equivalent of "contain" fitting followed by flattening: the result is
 * fully opaque.
 */
[[nodiscard]] Result<ImageBuffer> contain_square(const ImageBuffer &src,
                                                 uint32_t size,
                                                 Color::RGBA background,
                                                 Stage stage);

/// Encode as baseline JPEG (alpha is dropped; flatten first)
[[nodiscard]] Result<std::vector<uint8_t>> encode_jpeg(const ImageBuffer &img,
                                                       int quality);

/// Encode as PNG with alpha
[[nodiscard]] Result<std::vector<uint8_t>> encode_png(const ImageBuffer &img);

/**
 * @brief Write bytes to path through a temporary sibling file
 *
 * The destination either receives the complete file or is left untouched.
 */
[[nodiscard]] Result<std::filesystem::path>
write_file_atomic(const std::filesystem::path &path,
                  std::span<const uint8_t> bytes);

} // namespace PosterEngine::Codec
