/**
 * @file poster_config.cpp
 * @brief Configuration parsing and serialization
 */

#include "engine/poster_config.hpp"

#include <cstdint>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace PosterEngine {

// JSON parsing helpers
namespace {

Color::RGBA parse_color(const json &j, const char *key, Color::RGBA fallback) {
  if (!j.contains(key)) {
    return fallback;
  }
  const std::string hex = j.at(key).get<std::string>();
  auto color = Color::try_parse_hex(hex);
  if (!color) {
    throw std::runtime_error(std::string("Invalid color for palette.") + key +
                             ": " + hex);
  }
  return *color;
}

Palette parse_palette(const json &j) {
  Palette palette;
  palette.ink = parse_color(j, "ink", palette.ink);
  palette.footer_background =
      parse_color(j, "footer_background", palette.footer_background);
  palette.divider = parse_color(j, "divider", palette.divider);
  palette.canvas = parse_color(j, "canvas", palette.canvas);
  return palette;
}

std::filesystem::path resolve_path(const std::string &value,
                                   const std::filesystem::path &base_dir) {
  if (value.empty()) {
    return {};
  }
  std::filesystem::path p(value);
  if (p.is_relative() && !base_dir.empty()) {
    return base_dir / p;
  }
  return p;
}

Text::FontConfig parse_fonts(const json &j,
                             const std::filesystem::path &base_dir) {
  Text::FontConfig fonts;
  fonts.bold = resolve_path(j.value("bold", ""), base_dir);
  fonts.italic = resolve_path(j.value("italic", ""), base_dir);
  fonts.symbol = resolve_path(j.value("symbol", ""), base_dir);
  return fonts;
}

} // anonymous namespace

PosterConfig PosterConfig::from_json(const std::string &json_str,
                                     const std::filesystem::path &base_dir) {
  json j = json::parse(json_str);

  PosterConfig cfg;

  // Read signed so negative values are rejected instead of wrapping
  const int64_t width = j.value("working_width", int64_t{800});
  if (width < 1 || width > MaxWorkingWidth) {
    throw std::runtime_error("working_width must be in [1, " +
                             std::to_string(MaxWorkingWidth) + "], got " +
                             std::to_string(width));
  }
  cfg.working_width = static_cast<uint32_t>(width);

  cfg.jpeg_quality = j.value("jpeg_quality", 80);
  if (cfg.jpeg_quality < 1 || cfg.jpeg_quality > 100) {
    throw std::runtime_error("jpeg_quality must be in [1, 100], got " +
                             std::to_string(cfg.jpeg_quality));
  }

  cfg.verbose = j.value("verbose", true);
  cfg.text.brand = j.value("brand", cfg.text.brand);
  cfg.text.tagline = j.value("tagline", cfg.text.tagline);

  if (j.contains("fonts")) {
    cfg.fonts = parse_fonts(j["fonts"], base_dir);
  }
  if (j.contains("palette")) {
    cfg.palette = parse_palette(j["palette"]);
  }

  return cfg;
}

std::string PosterConfig::to_json() const {
  json j;

  j["working_width"] = working_width;
  j["jpeg_quality"] = jpeg_quality;
  j["verbose"] = verbose;
  j["brand"] = text.brand;
  j["tagline"] = text.tagline;

  j["fonts"] = {{"bold", fonts.bold.string()},
                {"italic", fonts.italic.string()},
                {"symbol", fonts.symbol.string()}};

  j["palette"] = {{"ink", Color::to_hex(palette.ink)},
                  {"footer_background",
                   Color::to_hex(palette.footer_background)},
                  {"divider", Color::to_hex(palette.divider)},
                  {"canvas", Color::to_hex(palette.canvas)}};

  return j.dump(2);
}

Result<PosterConfig> PosterConfig::load(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return PosterError::config(path.string(), "cannot open config file");
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  try {
    return from_json(buffer.str(), path.parent_path());
  } catch (const json::exception &e) {
    return PosterError::config(path.string(),
                               std::string("malformed JSON: ") + e.what());
  } catch (const std::runtime_error &e) {
    return PosterError::config(path.string(), e.what());
  }
}

} // namespace PosterEngine
