#pragma once
/**
 * @file markup.hpp
 * @brief Markup escaping and UTF-8 helpers shared by fitting and rendering
 */

#include <cstddef>
#include <string>
#include <string_view>

namespace PosterEngine::Text {

/// Escape & < > " ' as XML entities
[[nodiscard]] std::string escape_markup(std::string_view raw);

/// Reverse escape_markup (only the five entities it produces)
[[nodiscard]] std::string unescape_markup(std::string_view escaped);

/// Decode UTF-8; malformed sequences become U+FFFD
[[nodiscard]] std::u32string decode_utf8(std::string_view utf8);

/// Number of codepoints in a UTF-8 string
[[nodiscard]] std::size_t count_codepoints(std::string_view utf8);

/// Codepoints that select a presentation and have no glyph of their own
[[nodiscard]] constexpr bool is_invisible_modifier(char32_t cp) noexcept {
  return cp == 0xFE0E || cp == 0xFE0F || cp == 0x200D;
}

} // namespace PosterEngine::Text
