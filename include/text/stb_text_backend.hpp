#pragma once
/**
 * @file stb_text_backend.hpp
 * @brief stb_truetype glyph rasterizer
 */

#include "text/text_backend.hpp"

namespace PosterEngine::Text {

class StbTextBackend final : public TextBackend {
public:
  explicit StbTextBackend(std::shared_ptr<const FontSet> fonts);

  [[nodiscard]] std::string name() const override { return "stb_truetype"; }

  [[nodiscard]] Result<int> draw_line(ImageBuffer &img,
                                      const LineRequest &line) const override;

private:
  std::shared_ptr<const FontSet> fonts_;
};

} // namespace PosterEngine::Text
