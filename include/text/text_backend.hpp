#pragma once
/**
 * @file text_backend.hpp
 * @brief Glyph rasterization backend interface
 *
 * The backend is chosen at build time (PE_TEXT_BACKEND=stb|freetype);
 * layout and fitting never depend on which one is compiled in.
 */

#include "core/color.hpp"
#include "core/result.hpp"
#include "image/image_buffer.hpp"
#include "text/font_set.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace PosterEngine::Text {

/// One line to draw
struct LineRequest {
  std::u32string_view text; ///< Decoded codepoints (entities already resolved)
  FaceRole face = FaceRole::Bold;
  float x = 0.0f;        ///< Left edge of the pen
  float anchor_y = 0.0f; ///< Vertical middle of the line box
  float font_size = 0.0f;
  Color::RGBA ink = Color::Colors::FooterInk;
};

class TextBackend {
public:
  virtual ~TextBackend() = default;

  /// Backend name (e.g. "stb_truetype", "FreeType")
  [[nodiscard]] virtual std::string name() const = 0;

  /**
   * @brief Draw one line of text
   * @return Right edge of the drawn line in pixels
   */
  [[nodiscard]] virtual Result<int> draw_line(ImageBuffer &img,
                                              const LineRequest &line) const = 0;

  /// Create the backend selected at build time
  [[nodiscard]] static std::unique_ptr<TextBackend>
  create(std::shared_ptr<const FontSet> fonts);
};

} // namespace PosterEngine::Text
