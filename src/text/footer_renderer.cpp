/**
 * @file footer_renderer.cpp
 * @brief Footer text layout and rasterization
 */

#include "text/footer_renderer.hpp"
#include "text/markup.hpp"

#include <algorithm>

namespace PosterEngine::Text {

FooterRenderer::FooterRenderer(std::shared_ptr<const FontSet> fonts,
                               Color::RGBA ink)
    : fonts_(std::move(fonts)), backend_(TextBackend::create(fonts_)),
      ink_(ink) {}

FooterRenderer::~FooterRenderer() = default;
FooterRenderer::FooterRenderer(FooterRenderer &&) noexcept = default;
FooterRenderer &FooterRenderer::operator=(FooterRenderer &&) noexcept = default;

std::string FooterRenderer::backend_name() const { return backend_->name(); }

Result<RenderedText> FooterRenderer::render(const FittedText &fitted,
                                            int text_width,
                                            int footer_height) const {
  if (text_width <= 0 || footer_height <= 0) {
    return PosterError{ErrorKind::InputValidation, Stage::TextRender,
                       "text layer",
                       "text layer must have positive size, got " +
                           std::to_string(text_width) + "x" +
                           std::to_string(footer_height)};
  }

  RenderedText out;
  out.layer = ImageBuffer::create(static_cast<uint32_t>(text_width),
                                  static_cast<uint32_t>(footer_height));

  const int line_height = fitted.line_height_px;
  const int total_height = line_height * static_cast<int>(fitted.lines.size());
  const float vertical_padding = (footer_height - total_height) / 2.0f;
  float anchor_y = vertical_padding + line_height * FirstLineOffset;

  int widest = 0;
  for (size_t i = 0; i < fitted.lines.size(); ++i) {
    // Lines are markup-escaped; a direct-draw backend draws the characters
    const std::u32string text =
        decode_utf8(unescape_markup(fitted.lines[i]));

    LineRequest request;
    request.text = text;
    request.face = (i == RoleLine) ? FaceRole::Italic : FaceRole::Bold;
    request.x = static_cast<float>(LeftPadding);
    request.anchor_y = anchor_y;
    request.font_size = static_cast<float>(fitted.font_size_px);
    request.ink = ink_;

    auto right = backend_->draw_line(out.layer, request);
    if (!right) {
      return std::move(right.error());
    }
    widest = std::max(widest, *right);
    anchor_y += line_height;
  }

  out.measured_width = std::clamp(widest, 0, text_width);
  return out;
}

} // namespace PosterEngine::Text
