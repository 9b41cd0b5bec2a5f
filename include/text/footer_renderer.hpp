#pragma once
/**
 * @file footer_renderer.hpp
 * @brief Rasterizes fitted footer text into a transparent layer
 */

#include "core/color.hpp"
#include "core/result.hpp"
#include "image/image_buffer.hpp"
#include "text/font_set.hpp"
#include "text/text_backend.hpp"
#include "text/text_fitter.hpp"

#include <memory>
#include <string>

namespace PosterEngine::Text {

/// Rendered text block
struct RenderedText {
  ImageBuffer layer;      ///< Exactly text_width x footer_height
  int measured_width = 0; ///< Widest line's right edge, <= layer width
};

/**
 * @brief Footer text renderer
 *
 * Four lines, left aligned at 2px, vertically centered as a block with
 * line pitch round(font * 1.5). The role line uses the italic face.
 */
class FooterRenderer {
public:
  static constexpr int LeftPadding = 2;
  static constexpr float FirstLineOffset = 0.6f;

  explicit FooterRenderer(std::shared_ptr<const FontSet> fonts,
                          Color::RGBA ink = Color::Colors::FooterInk);
  ~FooterRenderer();

  FooterRenderer(FooterRenderer &&) noexcept;
  FooterRenderer &operator=(FooterRenderer &&) noexcept;
  FooterRenderer(const FooterRenderer &) = delete;
  FooterRenderer &operator=(const FooterRenderer &) = delete;

  /**
   * @brief Render fitted lines
   * @param fitted Output of fit_text()
   * @param text_width Layer width in pixels
   * @param footer_height Layer height in pixels
   */
  [[nodiscard]] Result<RenderedText> render(const FittedText &fitted,
                                            int text_width,
                                            int footer_height) const;

  /// Name of the compiled-in rasterizer
  [[nodiscard]] std::string backend_name() const;

private:
  std::shared_ptr<const FontSet> fonts_;
  std::unique_ptr<TextBackend> backend_;
  Color::RGBA ink_;
};

} // namespace PosterEngine::Text
