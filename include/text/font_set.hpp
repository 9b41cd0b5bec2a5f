#pragma once
/**
 * @file font_set.hpp
 * @brief Immutable set of font faces used by the footer renderer
 *
 * Loaded once at startup and shared read-only between concurrent
 * renders. Loading fails if any face is missing, unreadable, or if the
 * symbol face cannot draw the tagline bullets.
 */

#include "core/result.hpp"

#include <stb/stb_truetype.h>

#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace PosterEngine::Text {

/// Face slots in the fallback chain
enum class FaceRole { Bold, Italic, Symbol };

[[nodiscard]] const char *to_string(FaceRole role) noexcept;

/// Font file locations
struct FontConfig {
  std::filesystem::path bold;   ///< Name, tagline and phone lines
  std::filesystem::path italic; ///< Role line
  std::filesystem::path symbol; ///< Fallback for checkmarks and emoji
};

/// Codepoint the symbol face must cover (HEAVY CHECK MARK)
constexpr char32_t RequiredSymbol = 0x2714;

/// One loaded font file
struct FontFace {
  FaceRole role = FaceRole::Bold;
  std::filesystem::path path;
  std::vector<uint8_t> data; ///< Raw file bytes (FreeType loads from here too)
  int offset = 0;            ///< Offset of face 0 inside data
  stbtt_fontinfo info{};

  /// Glyph index for a codepoint, 0 if missing
  [[nodiscard]] int glyph_index(char32_t cp) const;

  [[nodiscard]] bool has_glyph(char32_t cp) const { return glyph_index(cp) != 0; }
};

class FontSet {
  struct Token {
    explicit Token() = default;
  };

public:
  explicit FontSet(Token) {}

  /**
   * @brief Load all faces
   * @param verbose Print a line per loaded face
   * @return Shared immutable set, or FontResourceError naming the file
   */
  [[nodiscard]] static Result<std::shared_ptr<const FontSet>>
  load(const FontConfig &config, bool verbose = true);

  FontSet(const FontSet &) = delete;
  FontSet &operator=(const FontSet &) = delete;

  [[nodiscard]] const FontFace &face(FaceRole role) const;

  /**
   * @brief Walk the fallback chain for a codepoint
   * @return primary if it covers cp, else Symbol if it does, else nullopt
   */
  [[nodiscard]] std::optional<FaceRole> resolve(FaceRole primary,
                                                char32_t cp) const;

private:
  std::array<FontFace, 3> faces_;
};

} // namespace PosterEngine::Text
