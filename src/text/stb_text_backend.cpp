/**
 * @file stb_text_backend.cpp
 * @brief Text rendering using stb_truetype
 *
 * Each codepoint goes through the FontSet fallback chain; faces are
 * scaled by em size so all backends agree on what "font size" means.
 */

#include "text/stb_text_backend.hpp"
#include "text/markup.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace PosterEngine::Text {

StbTextBackend::StbTextBackend(std::shared_ptr<const FontSet> fonts)
    : fonts_(std::move(fonts)) {}

Result<int> StbTextBackend::draw_line(ImageBuffer &img,
                                      const LineRequest &line) const {
  if (!(line.font_size > 0.0f)) {
    return PosterError{ErrorKind::InputValidation, Stage::TextRender,
                       "font size",
                       "font size must be positive, got " +
                           std::to_string(line.font_size)};
  }

  const FontFace &primary = fonts_->face(line.face);
  const float primary_scale =
      stbtt_ScaleForMappingEmToPixels(&primary.info, line.font_size);

  // Center the primary face's ascent/descent box on the anchor
  int ascent = 0, descent = 0, line_gap = 0;
  stbtt_GetFontVMetrics(&primary.info, &ascent, &descent, &line_gap);
  const float baseline =
      line.anchor_y + (ascent + descent) * 0.5f * primary_scale;

  float cursor_x = line.x;
  float right_edge = line.x;
  const FontFace *prev_face = nullptr;
  int prev_glyph = 0;

  for (char32_t cp : line.text) {
    if (is_invisible_modifier(cp)) {
      continue;
    }

    auto role = fonts_->resolve(line.face, cp);
    if (!role) {
      std::cerr << "⚠️ No glyph for U+" << std::hex << static_cast<uint32_t>(cp)
                << std::dec << " in " << primary.path.string()
                << " or symbol fallback; drawing missing-glyph box"
                << std::endl;
    }
    const FontFace &face = role ? fonts_->face(*role) : primary;
    const int glyph = face.glyph_index(cp);
    const float scale =
        (&face == &primary)
            ? primary_scale
            : stbtt_ScaleForMappingEmToPixels(&face.info, line.font_size);

    // Kerning only applies within one face
    if (prev_face == &face && prev_glyph != 0) {
      cursor_x +=
          stbtt_GetGlyphKernAdvance(&face.info, prev_glyph, glyph) * scale;
    }

    int advance = 0, lsb = 0;
    stbtt_GetGlyphHMetrics(&face.info, glyph, &advance, &lsb);

    const float shift_x = cursor_x - std::floor(cursor_x);
    int x0 = 0, y0 = 0, x1 = 0, y1 = 0;
    stbtt_GetGlyphBitmapBoxSubpixel(&face.info, glyph, scale, scale, shift_x,
                                    0.0f, &x0, &y0, &x1, &y1);

    const int glyph_w = x1 - x0;
    const int glyph_h = y1 - y0;

    if (glyph_w > 0 && glyph_h > 0) {
      std::vector<uint8_t> bitmap(static_cast<size_t>(glyph_w) * glyph_h);
      stbtt_MakeGlyphBitmapSubpixel(&face.info, bitmap.data(), glyph_w,
                                    glyph_h, glyph_w, scale, scale, shift_x,
                                    0.0f, glyph);

      // Blit to image
      const int px = static_cast<int>(std::floor(cursor_x)) + x0;
      const int py = static_cast<int>(std::lround(baseline)) + y0;

      for (int gy = 0; gy < glyph_h; ++gy) {
        for (int gx = 0; gx < glyph_w; ++gx) {
          uint8_t coverage = bitmap[static_cast<size_t>(gy) * glyph_w + gx];
          if (coverage == 0)
            continue;
          img.blend_pixel(px + gx, py + gy,
                          Color::with_coverage(line.ink, coverage));
        }
      }
      right_edge = std::max(right_edge, static_cast<float>(px + glyph_w));
    }

    cursor_x += advance * scale;
    right_edge = std::max(right_edge, cursor_x);
    prev_face = &face;
    prev_glyph = glyph;
  }

  return static_cast<int>(std::ceil(right_edge));
}

} // namespace PosterEngine::Text
