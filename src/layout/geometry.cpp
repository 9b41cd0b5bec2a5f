/**
 * @file geometry.cpp
 * @brief Footer layout planner
 */

#include "layout/geometry.hpp"

#include <algorithm>
#include <cmath>

namespace PosterEngine {

namespace {

// Estimated line height used only for sizing the footer band
constexpr double FooterLineFactor = 1.18;
constexpr int FooterLines = 4;

Geometry with_right_section(Geometry g, int line_x) {
  g.line_x = line_x;
  g.logo_x = std::min(g.line_x + g.line_width + Layout::DividerToLogo,
                      g.max_logo_left());
  return g;
}

} // anonymous namespace

Geometry plan_geometry(int template_width) {
  Geometry g;
  const int w = template_width;
  g.template_width = w;

  g.photo_size = static_cast<int>(std::floor(w * 0.18));
  g.font_size_base = static_cast<int>(std::lround(w * 0.022));
  g.logo_size = static_cast<int>(std::floor(w * 0.15));

  g.photo_left = Layout::PhotoLeft;
  g.text_left = g.photo_left + g.photo_size + Layout::PhotoTextGap;

  const int reserved_right =
      Layout::LineGap + g.line_width + g.logo_size + g.right_margin;
  g.text_width = std::max(static_cast<int>(std::floor(w * 0.38)),
                          w - g.text_left - reserved_right);
  if (g.text_width < Layout::MinTextWidth) {
    g.text_width = std::max(Layout::MinTextWidth,
                            static_cast<int>(std::floor(w * 0.35)));
  }

  const int line_height =
      static_cast<int>(std::lround(g.font_size_base * FooterLineFactor));
  const int required_text_height = line_height * FooterLines;
  g.footer_height =
      std::max({g.photo_size, required_text_height, g.logo_size}) +
      Layout::FooterPadding;

  return with_right_section(g,
                            g.text_left + g.text_width + Layout::TextToDivider);
}

Geometry place_right_section(const Geometry &plan, int measured_text_width) {
  const int measured = std::max(measured_text_width, 0);
  const int right_section_start =
      plan.text_left + measured + Layout::MeasuredSlack;
  const int line_x =
      std::min(plan.text_left + plan.text_width + Layout::TextToDivider,
               right_section_start + Layout::TextToDivider);
  return with_right_section(plan, line_x);
}

} // namespace PosterEngine
