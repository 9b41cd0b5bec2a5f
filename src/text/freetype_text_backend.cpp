/**
 * @file freetype_text_backend.cpp
 * @brief Text rendering using FreeType 2
 */

#include "text/freetype_text_backend.hpp"
#include "text/markup.hpp"

#include <ft2build.h>
#include FT_FREETYPE_H

#include <algorithm>
#include <array>
#include <cmath>
#include <iostream>
#include <sstream>
#include <string>

namespace PosterEngine::Text {

namespace {

/// Library plus lazily opened faces for one draw call
class FreeTypeSession {
public:
  explicit FreeTypeSession(const FontSet &fonts) : fonts_(fonts) {
    error_ = FT_Init_FreeType(&library_);
  }

  ~FreeTypeSession() {
    for (FT_Face face : faces_) {
      if (face)
        FT_Done_Face(face);
    }
    if (library_)
      FT_Done_FreeType(library_);
  }

  FreeTypeSession(const FreeTypeSession &) = delete;
  FreeTypeSession &operator=(const FreeTypeSession &) = delete;

  [[nodiscard]] bool ready() const { return error_ == 0 && library_; }
  [[nodiscard]] FT_Error error() const { return error_; }

  /// Open (once) and size a face into `out`; FreeType error code on failure
  FT_Error face(FaceRole role, float font_size, FT_Face &out) {
    out = nullptr;
    FT_Face &slot = faces_[static_cast<size_t>(role)];
    if (!slot) {
      const FontFace &src = fonts_.face(role);
      FT_Error err = FT_New_Memory_Face(
          library_, src.data.data(), static_cast<FT_Long>(src.data.size()), 0,
          &slot);
      if (err) {
        slot = nullptr;
        return err;
      }
    }
    // 26.6 fixed point em size at 72 dpi == pixels
    FT_Error err = FT_Set_Char_Size(
        slot, 0, static_cast<FT_F26Dot6>(font_size * 64.0f), 72, 72);
    if (err) {
      return err;
    }
    out = slot;
    return 0;
  }

private:
  const FontSet &fonts_;
  FT_Library library_ = nullptr;
  FT_Error error_ = 0;
  std::array<FT_Face, 3> faces_{};
};

PosterError font_error(const FontFace &src, FT_Error err) {
  std::cerr << "❌ FreeType: cannot use " << src.path.string() << " (error "
            << err << ")" << std::endl;
  return PosterError{ErrorKind::FontResource, Stage::TextRender,
                     src.path.string(),
                     "FreeType cannot open or size font (error " +
                         std::to_string(err) + ")"};
}

} // anonymous namespace

FreeTypeTextBackend::FreeTypeTextBackend(std::shared_ptr<const FontSet> fonts)
    : fonts_(std::move(fonts)) {}

Result<int> FreeTypeTextBackend::draw_line(ImageBuffer &img,
                                           const LineRequest &line) const {
  if (!(line.font_size > 0.0f)) {
    return PosterError{ErrorKind::InputValidation, Stage::TextRender,
                       "font size",
                       "font size must be positive, got " +
                           std::to_string(line.font_size)};
  }

  FreeTypeSession session(*fonts_);
  if (!session.ready()) {
    return PosterError{ErrorKind::FontResource, Stage::TextRender, "FreeType",
                       "FT_Init_FreeType failed with error " +
                           std::to_string(session.error())};
  }

  const FontFace &primary_src = fonts_->face(line.face);
  FT_Face primary = nullptr;
  if (FT_Error err = session.face(line.face, line.font_size, primary)) {
    return font_error(primary_src, err);
  }

  // Center the ascender/descender box on the anchor
  const float ascender = primary->size->metrics.ascender / 64.0f;
  const float descender = primary->size->metrics.descender / 64.0f;
  const float baseline = line.anchor_y + (ascender + descender) * 0.5f;
  const int baseline_px = static_cast<int>(std::lround(baseline));

  float cursor_x = line.x;
  float right_edge = line.x;
  FT_Face prev_face = nullptr;
  FT_UInt prev_glyph = 0;

  for (char32_t cp : line.text) {
    if (is_invisible_modifier(cp)) {
      continue;
    }

    auto role = fonts_->resolve(line.face, cp);
    if (!role) {
      std::cerr << "⚠️ No glyph for U+" << std::hex << static_cast<uint32_t>(cp)
                << std::dec << " in " << primary_src.path.string()
                << " or symbol fallback; drawing missing-glyph box"
                << std::endl;
    }
    FT_Face face = primary;
    if (role) {
      if (FT_Error err = session.face(*role, line.font_size, face)) {
        return font_error(fonts_->face(*role), err);
      }
    }

    FT_UInt glyph = FT_Get_Char_Index(face, cp);

    if (face == prev_face && prev_glyph != 0 && FT_HAS_KERNING(face)) {
      FT_Vector kern;
      if (FT_Get_Kerning(face, prev_glyph, glyph, FT_KERNING_DEFAULT, &kern) ==
          0) {
        cursor_x += kern.x / 64.0f;
      }
    }

    FT_Error err = FT_Load_Glyph(face, glyph, FT_LOAD_DEFAULT);
    if (!err) {
      err = FT_Render_Glyph(face->glyph, FT_RENDER_MODE_NORMAL);
    }
    if (err) {
      std::ostringstream message;
      message << "FreeType cannot render U+" << std::hex
              << static_cast<uint32_t>(cp) << std::dec << " (error " << err
              << ")";
      return PosterError{ErrorKind::FontResource, Stage::TextRender,
                         fonts_->face(role ? *role : line.face).path.string(),
                         message.str()};
    }

    const FT_Bitmap &bitmap = face->glyph->bitmap;
    const int px = static_cast<int>(std::floor(cursor_x)) +
                   face->glyph->bitmap_left;
    const int py = baseline_px - face->glyph->bitmap_top;

    for (unsigned int gy = 0; gy < bitmap.rows; ++gy) {
      for (unsigned int gx = 0; gx < bitmap.width; ++gx) {
        uint8_t coverage =
            bitmap.buffer[static_cast<int>(gy) * bitmap.pitch +
                          static_cast<int>(gx)];
        if (coverage == 0)
          continue;
        img.blend_pixel(px + static_cast<int>(gx), py + static_cast<int>(gy),
                        Color::with_coverage(line.ink, coverage));
      }
    }
    if (bitmap.width > 0) {
      right_edge = std::max(right_edge,
                            static_cast<float>(px + static_cast<int>(bitmap.width)));
    }

    cursor_x += face->glyph->advance.x / 64.0f;
    right_edge = std::max(right_edge, cursor_x);
    prev_face = face;
    prev_glyph = glyph;
  }

  return static_cast<int>(std::ceil(right_edge));
}

} // namespace PosterEngine::Text
