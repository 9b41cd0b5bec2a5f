#pragma once
/**
 * @file text_fitter.hpp
 * @brief Footer text content and font-size fitting
 *
 * Builds the four footer lines and picks one font size for all of them
 * using a fixed average-glyph-width estimate, so the result does not
 * depend on which text backend renders it.
 */

#include <array>
#include <string>
#include <string_view>
#include <variant>

namespace PosterEngine::Text {

/// Fitting constants
namespace Fit {
constexpr int MinFontSize = 12;
constexpr int MinStartFontSize = 18;
constexpr double CharWidthFactor = 0.55;
constexpr double ShrinkFactor = 0.92;
constexpr int HorizontalPadding = 2;
constexpr int MinAvailableWidth = 10;
constexpr double LineHeightFactor = 1.5;
} // namespace Fit

/// Role shown as a normalized designation with the brand suffix
struct Designation {
  std::string value;
};

/// Team label shown verbatim
struct Team {
  std::string label;
};

/// What the second footer line displays
using DisplayRole = std::variant<Designation, Team>;

/// Raw per-person values for the footer
struct TextFields {
  std::string name;
  DisplayRole role;
  std::string phone;
};

/// Per-deployment constant text
struct TextContent {
  std::string brand = "WealthPlus";
  std::string tagline = "✔️ Investments ✔️ Insurance ✔️ Properties";
};

/// Fitting result; lines are already markup-escaped
struct FittedText {
  std::array<std::string, 4> lines;
  int font_size_px = 0;
  int line_height_px = 0;
};

/// Index of the role line (drawn in italic)
constexpr size_t RoleLine = 1;

/**
 * @brief Resolve the second-line role from raw person fields
 *
 * A non-empty team name wins. Otherwise the last "Team: X" token in the
 * designation (comma separated) becomes the team label, else the
 * designation itself is used.
 */
[[nodiscard]] DisplayRole resolve_display_role(std::string_view team_name,
                                               std::string_view designation);

/// "Wealth Manager | brand", "Health Insurance Advisor | brand",
/// "<collapsed> | brand" or "N/A | brand"
[[nodiscard]] std::string normalize_designation(std::string_view raw,
                                                std::string_view brand);

/// Second-line text for a role (unescaped)
[[nodiscard]] std::string format_role(const DisplayRole &role,
                                      std::string_view brand);

/// Estimated rendered width: codepoints * font_size * 0.55
[[nodiscard]] double estimate_line_width(std::string_view line,
                                         int font_size);

/**
 * @brief Build the escaped lines and shrink the font until they fit
 * @param target_width Width of the text box in pixels
 * @param requested_base_font_size Starting size (raised to at least 18)
 *
 * The size only shrinks (by 8% per step) and stops at 12 even if the
 * longest line still overflows.
 */
[[nodiscard]] FittedText fit_text(const TextFields &fields,
                                  const TextContent &content, int target_width,
                                  int requested_base_font_size);

} // namespace PosterEngine::Text
