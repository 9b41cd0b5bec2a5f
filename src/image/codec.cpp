/**
 * @file codec.cpp
 * @brief stb-backed image codec implementation
 */

#include "image/codec.hpp"

#define STB_IMAGE_IMPLEMENTATION
#include <stb/stb_image.h>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image_write.h>

#define STB_IMAGE_RESIZE_IMPLEMENTATION
#include <stb/stb_image_resize2.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>

namespace PosterEngine::Codec {

namespace {

struct StbiDeleter {
  void operator()(stbi_uc *p) const { stbi_image_free(p); }
};
using StbiPixels = std::unique_ptr<stbi_uc, StbiDeleter>;

ImageBuffer adopt_pixels(const stbi_uc *pixels, int w, int h) {
  ImageBuffer img = ImageBuffer::create(static_cast<uint32_t>(w),
                                        static_cast<uint32_t>(h));
  std::copy(pixels, pixels + img.data.size(), img.data.begin());
  return img;
}

const char *failure_reason() {
  const char *reason = stbi_failure_reason();
  return reason ? reason : "unknown decoder failure";
}

// stbi_write_*_to_func sink
void append_bytes(void *context, void *data, int size) {
  auto *out = static_cast<std::vector<uint8_t> *>(context);
  auto *bytes = static_cast<const uint8_t *>(data);
  out->insert(out->end(), bytes, bytes + size);
}

} // anonymous namespace

Result<ImageBuffer> decode_file(const std::filesystem::path &path,
                                Stage stage) {
  int w = 0, h = 0, channels = 0;
  StbiPixels pixels(stbi_load(path.string().c_str(), &w, &h, &channels, 4));
  if (!pixels || w <= 0 || h <= 0) {
    return PosterError::decode(stage, path.string(),
                               std::string("cannot decode image: ") +
                                   failure_reason());
  }
  return adopt_pixels(pixels.get(), w, h);
}

Result<ImageBuffer> decode_memory(std::span<const uint8_t> bytes, Stage stage) {
  int w = 0, h = 0, channels = 0;
  StbiPixels pixels(stbi_load_from_memory(bytes.data(),
                                          static_cast<int>(bytes.size()), &w,
                                          &h, &channels, 4));
  if (!pixels || w <= 0 || h <= 0) {
    return PosterError::decode(stage, "<memory>",
                               std::string("cannot decode image: ") +
                                   failure_reason());
  }
  return adopt_pixels(pixels.get(), w, h);
}

Result<ImageBuffer> resize(const ImageBuffer &src, uint32_t w, uint32_t h,
                           Stage stage) {
  const std::string dims = std::to_string(src.width) + "x" +
                           std::to_string(src.height) + " -> " +
                           std::to_string(w) + "x" + std::to_string(h);
  if (static_cast<uint64_t>(w) * h > MaxPixels) {
    return PosterError::decode(stage, "resize",
                               "target size too large: " + dims);
  }
  if (src.width == w && src.height == h) {
    return src;
  }

  ImageBuffer out = ImageBuffer::create(w, h);
  if (src.empty() || out.empty()) {
    return out;
  }

  // STBIR_RGBA: unpremultiplied input, resampled with alpha weighting
  if (!stbir_resize_uint8_linear(
          src.data.data(), static_cast<int>(src.width),
          static_cast<int>(src.height), static_cast<int>(src.width * 4),
          out.data.data(), static_cast<int>(w), static_cast<int>(h),
          static_cast<int>(w * 4), STBIR_RGBA)) {
    std::cerr << "❌ Resize " << dims << " failed" << std::endl;
    return PosterError::decode(stage, "resize", "resampler failed: " + dims);
  }
  return out;
}

Result<ImageBuffer> resize_to_width(const ImageBuffer &src,
                                    uint32_t target_width, Stage stage) {
  if (src.empty() || target_width == 0) {
    return ImageBuffer::create(target_width, 0);
  }
  double scale = static_cast<double>(target_width) / src.width;
  double h = std::max(std::round(src.height * scale), 1.0);
  if (h * target_width > static_cast<double>(MaxPixels)) {
    return PosterError::decode(stage, "resize",
                               "resized image too large: " +
                                   std::to_string(target_width) + " wide, " +
                                   std::to_string(static_cast<uint64_t>(h)) +
                                   " high");
  }
  return resize(src, target_width, static_cast<uint32_t>(h), stage);
}

Result<ImageBuffer> contain_square(const ImageBuffer &src, uint32_t size,
                                   Color::RGBA background, Stage stage) {
  if (static_cast<uint64_t>(size) * size > MaxPixels) {
    return PosterError::decode(stage, "resize",
                               "square too large: " + std::to_string(size));
  }
  ImageBuffer square = ImageBuffer::filled(size, size, background);
  if (src.empty() || size == 0) {
    return square;
  }

  double scale = std::min(static_cast<double>(size) / src.width,
                          static_cast<double>(size) / src.height);
  auto w = std::clamp<uint32_t>(
      static_cast<uint32_t>(std::lround(src.width * scale)), 1, size);
  auto h = std::clamp<uint32_t>(
      static_cast<uint32_t>(std::lround(src.height * scale)), 1, size);

  auto scaled = resize(src, w, h, stage);
  if (!scaled) {
    return std::move(scaled.error());
  }
  square.composite(*scaled, {static_cast<int>((size - w) / 2),
                             static_cast<int>((size - h) / 2)});
  square.flatten(background);
  return square;
}

Result<std::vector<uint8_t>> encode_jpeg(const ImageBuffer &img, int quality) {
  if (img.empty()) {
    return PosterError::output(Stage::Encode, "jpeg",
                               "cannot encode an empty image");
  }

  // Drop alpha explicitly; stb would ignore it anyway
  std::vector<uint8_t> rgb(static_cast<size_t>(img.width) * img.height * 3);
  for (size_t i = 0, j = 0; i < img.data.size(); i += 4, j += 3) {
    rgb[j + 0] = img.data[i + 0];
    rgb[j + 1] = img.data[i + 1];
    rgb[j + 2] = img.data[i + 2];
  }

  std::vector<uint8_t> out;
  int ok = stbi_write_jpg_to_func(append_bytes, &out,
                                  static_cast<int>(img.width),
                                  static_cast<int>(img.height), 3, rgb.data(),
                                  std::clamp(quality, 1, 100));
  if (!ok || out.empty()) {
    return PosterError::output(Stage::Encode, "jpeg", "JPEG encoder failed");
  }
  return out;
}

Result<std::vector<uint8_t>> encode_png(const ImageBuffer &img) {
  if (img.empty()) {
    return PosterError::output(Stage::Encode, "png",
                               "cannot encode an empty image");
  }

  std::vector<uint8_t> out;
  int ok = stbi_write_png_to_func(
      append_bytes, &out, static_cast<int>(img.width),
      static_cast<int>(img.height), 4, img.data.data(),
      static_cast<int>(img.width * 4));
  if (!ok || out.empty()) {
    return PosterError::output(Stage::Encode, "png", "PNG encoder failed");
  }
  return out;
}

Result<std::filesystem::path>
write_file_atomic(const std::filesystem::path &path,
                  std::span<const uint8_t> bytes) {
  namespace fs = std::filesystem;

  fs::path partial = path;
  partial += ".partial";

  auto discard = [&partial] {
    std::error_code ec;
    fs::remove(partial, ec);
  };

  {
    std::ofstream file(partial, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      return PosterError::output(Stage::Write, path.string(),
                                 "cannot open output for writing");
    }
    file.write(reinterpret_cast<const char *>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
    file.flush();
    if (!file) {
      file.close();
      discard();
      return PosterError::output(Stage::Write, path.string(),
                                 "short write (disk full?)");
    }
  }

  std::error_code ec;
  fs::rename(partial, path, ec);
  if (ec) {
    discard();
    return PosterError::output(Stage::Write, path.string(),
                               "cannot move output into place: " +
                                   ec.message());
  }
  return path;
}

} // namespace PosterEngine::Codec
