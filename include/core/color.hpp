#pragma once
/**
 * @file color.hpp
 * @brief Header-only color utilities
 *
 * RGBA color, hex parsing/formatting and Porter-Duff blending used by the
 * compositor and the text backends.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace PosterEngine::Color {

// ============================================================================
// RGBA Color Structure
// ============================================================================

/**
 * @brief RGBA color with 8-bit components
 *
 * Memory layout is R, G, B, A (matches ImageBuffer pixels)
 */
struct RGBA {
  uint8_t r, g, b, a;

  /// Default constructor (white, opaque)
  constexpr RGBA() noexcept : r(255), g(255), b(255), a(255) {}

  /// Component constructor
  constexpr RGBA(uint8_t r_, uint8_t g_, uint8_t b_, uint8_t a_ = 255) noexcept
      : r(r_), g(g_), b(b_), a(a_) {}

  [[nodiscard]] constexpr bool operator==(const RGBA &other) const noexcept {
    return r == other.r && g == other.g && b == other.b && a == other.a;
  }
};

// ============================================================================
// Predefined Colors
// ============================================================================

namespace Colors {
constexpr RGBA White{255, 255, 255, 255};
constexpr RGBA Black{0, 0, 0, 255};
constexpr RGBA Transparent{0, 0, 0, 0};

// Poster palette
constexpr RGBA FooterInk{41, 45, 108, 255};         // #292D6C
constexpr RGBA FooterBackground{240, 247, 255, 255}; // #F0F7FF
constexpr RGBA Divider{27, 117, 187, 255};          // #1B75BB
} // namespace Colors

// ============================================================================
// Hex Colors
// ============================================================================

namespace detail {

/// Value of one hex digit, -1 if not a hex digit
constexpr int hex_digit(char c) noexcept {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // namespace detail

/**
 * @brief Parse a CSS-style hex color
 * @param hex "#RGB", "#RGBA", "#RRGGBB" or "#RRGGBBAA" ('#' optional)
 * @return Parsed color, or nullopt if malformed
 */
[[nodiscard]] constexpr std::optional<RGBA>
try_parse_hex(std::string_view hex) noexcept {
  if (!hex.empty() && hex.front() == '#') {
    hex.remove_prefix(1);
  }

  const bool shorthand = hex.size() == 3 || hex.size() == 4;
  if (!shorthand && hex.size() != 6 && hex.size() != 8) {
    return std::nullopt;
  }

  // 0xFF default covers the alpha slot of the 3- and 6-digit forms
  uint8_t channels[4] = {0, 0, 0, 0xFF};
  const size_t step = shorthand ? 1 : 2;
  for (size_t i = 0; i * step < hex.size(); ++i) {
    int hi = detail::hex_digit(hex[i * step]);
    int lo = shorthand ? hi : detail::hex_digit(hex[i * step + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    channels[i] = static_cast<uint8_t>(hi * 16 + lo);
  }
  return RGBA{channels[0], channels[1], channels[2], channels[3]};
}

/// Format as "#RRGGBB" (or "#RRGGBBAA" when not opaque)
[[nodiscard]] inline std::string to_hex(RGBA c) {
  static constexpr char digits[] = "0123456789ABCDEF";
  std::string out = "#";
  auto put = [&](uint8_t v) {
    out += digits[v >> 4];
    out += digits[v & 0xF];
  };
  put(c.r);
  put(c.g);
  put(c.b);
  if (c.a != 255) {
    put(c.a);
  }
  return out;
}

// ============================================================================
// Compositing
// ============================================================================

/**
 * @brief Source-over compositing of unpremultiplied colors
 * @param fg Color on top
 * @param bg Color underneath
 */
[[nodiscard]] constexpr RGBA blend_over(RGBA fg, RGBA bg) noexcept {
  if (fg.a == 255 || bg.a == 0) {
    return fg;
  }
  if (fg.a == 0) {
    return bg;
  }

  const float src_a = fg.a / 255.0f;
  const float dst_a = (bg.a / 255.0f) * (1.0f - src_a);
  const float out_a = src_a + dst_a;

  auto mix = [&](uint8_t f, uint8_t b) {
    return static_cast<uint8_t>((f * src_a + b * dst_a) / out_a + 0.5f);
  };
  return {mix(fg.r, bg.r), mix(fg.g, bg.g), mix(fg.b, bg.b),
          static_cast<uint8_t>(out_a * 255.0f + 0.5f)};
}

/// Scale alpha by a coverage value in [0, 255]
[[nodiscard]] constexpr RGBA with_coverage(RGBA c, uint8_t coverage) noexcept {
  return {c.r, c.g, c.b, static_cast<uint8_t>((c.a * coverage + 127) / 255)};
}

} // namespace PosterEngine::Color
