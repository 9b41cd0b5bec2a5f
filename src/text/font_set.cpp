/**
 * @file font_set.cpp
 * @brief Font loading with stb_truetype
 */

#define STB_TRUETYPE_IMPLEMENTATION
#include "text/font_set.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <system_error>

namespace PosterEngine::Text {

namespace {

Result<std::vector<uint8_t>> read_font_file(const std::filesystem::path &path,
                                            FaceRole role) {
  std::error_code ec;
  if (path.empty()) {
    return PosterError::font(to_string(role),
                             std::string("no font configured for ") +
                                 to_string(role) + " face");
  }
  if (!std::filesystem::is_regular_file(path, ec)) {
    return PosterError::font(path.string(), "font file not found");
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return PosterError::font(path.string(), "cannot open font file");
  }

  std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
  if (file.bad() || data.empty()) {
    return PosterError::font(path.string(), "failed to read font file");
  }
  return data;
}

} // anonymous namespace

const char *to_string(FaceRole role) noexcept {
  switch (role) {
  case FaceRole::Bold:
    return "bold";
  case FaceRole::Italic:
    return "italic";
  case FaceRole::Symbol:
    return "symbol";
  }
  return "unknown";
}

int FontFace::glyph_index(char32_t cp) const {
  return stbtt_FindGlyphIndex(&info, static_cast<int>(cp));
}

Result<std::shared_ptr<const FontSet>> FontSet::load(const FontConfig &config,
                                                     bool verbose) {
  auto set = std::make_shared<FontSet>(Token{});

  const std::array<std::pair<FaceRole, const std::filesystem::path *>, 3>
      sources{{{FaceRole::Bold, &config.bold},
               {FaceRole::Italic, &config.italic},
               {FaceRole::Symbol, &config.symbol}}};

  for (const auto &[role, path] : sources) {
    auto data = read_font_file(*path, role);
    if (!data) {
      std::cerr << "❌ Font " << to_string(role) << ": "
                << data.error().describe() << std::endl;
      return std::move(data.error());
    }

    FontFace &face = set->faces_[static_cast<size_t>(role)];
    face.role = role;
    face.path = *path;
    face.data = std::move(*data);

    face.offset = stbtt_GetFontOffsetForIndex(face.data.data(), 0);
    if (face.offset < 0) {
      return PosterError::font(path->string(), "invalid font file format");
    }
    if (!stbtt_InitFont(&face.info, face.data.data(), face.offset)) {
      return PosterError::font(path->string(), "failed to initialize font");
    }

    if (verbose) {
      std::cout << "🔤 Loaded " << to_string(role) << " font: "
                << path->string() << " (" << face.data.size() << " bytes)"
                << std::endl;
    }
  }

  const FontFace &symbol = set->face(FaceRole::Symbol);
  if (!symbol.has_glyph(RequiredSymbol)) {
    return PosterError::font(symbol.path.string(),
                             "symbol font has no glyph for U+2714 (tagline "
                             "bullets would not render)");
  }

  return std::shared_ptr<const FontSet>(std::move(set));
}

const FontFace &FontSet::face(FaceRole role) const {
  return faces_[static_cast<size_t>(role)];
}

std::optional<FaceRole> FontSet::resolve(FaceRole primary, char32_t cp) const {
  if (face(primary).has_glyph(cp)) {
    return primary;
  }
  if (face(FaceRole::Symbol).has_glyph(cp)) {
    return FaceRole::Symbol;
  }
  return std::nullopt;
}

} // namespace PosterEngine::Text
