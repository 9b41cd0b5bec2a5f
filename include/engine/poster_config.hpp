#pragma once
/**
 * @file poster_config.hpp
 * @brief Engine configuration (JSON)
 */

#include "core/color.hpp"
#include "core/result.hpp"
#include "text/font_set.hpp"
#include "text/text_fitter.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace PosterEngine {

/// Colors used by the compositor
struct Palette {
  Color::RGBA ink = Color::Colors::FooterInk;
  Color::RGBA footer_background = Color::Colors::FooterBackground;
  Color::RGBA divider = Color::Colors::Divider;
  Color::RGBA canvas = Color::Colors::White;
};

/// Root configuration
struct PosterConfig {
  static constexpr uint32_t MaxWorkingWidth = 8192;

  uint32_t working_width = 800; ///< 1..MaxWorkingWidth
  int jpeg_quality = 80;
  bool verbose = true;
  Text::TextContent text;
  Text::FontConfig fonts;
  Palette palette;

  /**
   * @brief Parse from JSON string
   * @param base_dir Directory relative font paths resolve against
   * @throws std::runtime_error / nlohmann::json::exception on bad input
   */
  static PosterConfig from_json(const std::string &json,
                                const std::filesystem::path &base_dir = {});

  /// Serialize to JSON string
  [[nodiscard]] std::string to_json() const;

  /// Read and parse a config file; errors become ErrorKind::Config
  [[nodiscard]] static Result<PosterConfig>
  load(const std::filesystem::path &path);
};

} // namespace PosterEngine
