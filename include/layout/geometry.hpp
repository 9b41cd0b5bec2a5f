#pragma once
/**
 * @file geometry.hpp
 * @brief Footer band layout plan
 *
 * All positions are in pixels relative to the footer band's top-left
 * corner. A Geometry value is never mutated: the measured-text pass
 * returns a new plan.
 */

namespace PosterEngine {

/// Fixed layout constants
namespace Layout {
constexpr int PhotoLeft = 40;
constexpr int PhotoTextGap = 20;
constexpr int LineWidth = 4;
constexpr int LineGap = 20;       ///< Reserved between text and divider
constexpr int RightMargin = 24;   ///< Between logo and right edge
constexpr int FooterPadding = 18; ///< Added to the tallest element
constexpr int MinTextWidth = 120;
constexpr int TextToDivider = 8; ///< Divider offset past the text box
constexpr int MeasuredSlack = 10;
constexpr int DividerToLogo = 16;
} // namespace Layout

/// Pixel layout plan for one poster
struct Geometry {
  int template_width = 0;
  int photo_size = 0;
  int font_size_base = 0;
  int logo_size = 0;
  int photo_left = Layout::PhotoLeft;
  int text_left = 0;
  int text_width = 0;
  int footer_height = 0;
  int line_width = Layout::LineWidth;
  int line_x = 0;
  int logo_x = 0;
  int right_margin = Layout::RightMargin;

  /// Rightmost allowed logo position
  [[nodiscard]] int max_logo_left() const {
    return template_width - logo_size - right_margin;
  }

  bool operator==(const Geometry &) const = default;
};

/**
 * @brief Compute the layout plan for a resized template width
 *
 * Divider and logo positions assume the text box is fully used; call
 * place_right_section() once the rendered text width is known.
 */
[[nodiscard]] Geometry plan_geometry(int template_width);

/**
 * @brief Tighten divider and logo to the measured text width
 * @param plan Plan from plan_geometry()
 * @param measured_text_width Rendered text extent (pixels from text_left)
 * @return New plan; logo_x never exceeds plan.max_logo_left()
 */
[[nodiscard]] Geometry place_right_section(const Geometry &plan,
                                           int measured_text_width);

} // namespace PosterEngine
