#pragma once
/**
 * @file freetype_text_backend.hpp
 * @brief FreeType glyph rasterizer
 *
 * FT_Library and FT_Face handles are not safe to share between threads,
 * so every draw call opens its own from the FontSet's in-memory bytes.
 */

#include "text/text_backend.hpp"

namespace PosterEngine::Text {

class FreeTypeTextBackend final : public TextBackend {
public:
  explicit FreeTypeTextBackend(std::shared_ptr<const FontSet> fonts);

  [[nodiscard]] std::string name() const override { return "FreeType"; }

  [[nodiscard]] Result<int> draw_line(ImageBuffer &img,
                                      const LineRequest &line) const override;

private:
  std::shared_ptr<const FontSet> fonts_;
};

} // namespace PosterEngine::Text
