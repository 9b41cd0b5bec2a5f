/**
 * @file image_buffer.cpp
 * @brief RGBA buffer implementation
 */

#include "image/image_buffer.hpp"

#include <algorithm>

namespace PosterEngine {

ImageBuffer ImageBuffer::create(uint32_t w, uint32_t h) {
  ImageBuffer buf;
  buf.width = w;
  buf.height = h;
  buf.channels = 4;
  buf.data.resize(static_cast<size_t>(w) * h * 4, 0);
  return buf;
}

ImageBuffer ImageBuffer::filled(uint32_t w, uint32_t h, Color::RGBA color) {
  ImageBuffer buf = create(w, h);
  buf.fill(color);
  return buf;
}

uint8_t *ImageBuffer::pixel(uint32_t x, uint32_t y) {
  if (x >= width || y >= height)
    return nullptr;
  return &data[(static_cast<size_t>(y) * width + x) * channels];
}

const uint8_t *ImageBuffer::pixel(uint32_t x, uint32_t y) const {
  if (x >= width || y >= height)
    return nullptr;
  return &data[(static_cast<size_t>(y) * width + x) * channels];
}

Color::RGBA ImageBuffer::at(uint32_t x, uint32_t y) const {
  const uint8_t *p = pixel(x, y);
  if (!p)
    return Color::Colors::Transparent;
  return {p[0], p[1], p[2], p[3]};
}

void ImageBuffer::fill(Color::RGBA color) {
  for (size_t i = 0; i < data.size(); i += 4) {
    data[i + 0] = color.r;
    data[i + 1] = color.g;
    data[i + 2] = color.b;
    data[i + 3] = color.a;
  }
}

void ImageBuffer::blend_pixel(int x, int y, Color::RGBA color) {
  if (x < 0 || y < 0 || color.a == 0)
    return;
  uint8_t *p = pixel(static_cast<uint32_t>(x), static_cast<uint32_t>(y));
  if (!p)
    return;

  Color::RGBA out = Color::blend_over(color, {p[0], p[1], p[2], p[3]});
  p[0] = out.r;
  p[1] = out.g;
  p[2] = out.b;
  p[3] = out.a;
}

void ImageBuffer::fill_rect(glm::ivec2 origin, glm::ivec2 size,
                            Color::RGBA color) {
  int x0 = std::max(origin.x, 0);
  int y0 = std::max(origin.y, 0);
  int x1 = std::min(origin.x + size.x, static_cast<int>(width));
  int y1 = std::min(origin.y + size.y, static_cast<int>(height));

  for (int y = y0; y < y1; ++y) {
    for (int x = x0; x < x1; ++x) {
      blend_pixel(x, y, color);
    }
  }
}

void ImageBuffer::composite(const ImageBuffer &src, glm::ivec2 origin) {
  int x0 = std::max(origin.x, 0);
  int y0 = std::max(origin.y, 0);
  int x1 = std::min(origin.x + static_cast<int>(src.width),
                    static_cast<int>(width));
  int y1 = std::min(origin.y + static_cast<int>(src.height),
                    static_cast<int>(height));

  for (int y = y0; y < y1; ++y) {
    for (int x = x0; x < x1; ++x) {
      blend_pixel(x, y,
                  src.at(static_cast<uint32_t>(x - origin.x),
                         static_cast<uint32_t>(y - origin.y)));
    }
  }
}

void ImageBuffer::flatten(Color::RGBA background) {
  background.a = 255;
  for (size_t i = 0; i < data.size(); i += 4) {
    Color::RGBA out = Color::blend_over(
        {data[i + 0], data[i + 1], data[i + 2], data[i + 3]}, background);
    data[i + 0] = out.r;
    data[i + 1] = out.g;
    data[i + 2] = out.b;
    data[i + 3] = 255;
  }
}

} // namespace PosterEngine
