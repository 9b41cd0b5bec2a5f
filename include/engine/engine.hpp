#pragma once
/**
 * @file engine.hpp
 * @brief Poster assembly engine
 */

#include "core/result.hpp"
#include "engine/poster_config.hpp"
#include "image/image_buffer.hpp"
#include "layout/geometry.hpp"
#include "text/font_set.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace PosterEngine {

/// Person shown in the footer
struct PersonInfo {
  std::string name;
  std::string designation;
  std::string phone;
  std::string team_name;       ///< Shown verbatim when non-empty
  std::filesystem::path photo; ///< Local, readable image file
};

/// One compositing call
struct PosterRequest {
  std::filesystem::path template_path;
  PersonInfo person;
  std::filesystem::path logo_path;
  std::filesystem::path output_path; ///< Unused by render_poster()
};

/// In-memory composition result
struct ComposedPoster {
  ImageBuffer image;
  Geometry geometry;
  uint32_t template_height = 0;
  int font_size_px = 0;
};

/// Written poster summary
struct PosterOutput {
  std::filesystem::path path;
  uint32_t width = 0;
  uint32_t height = 0;
  uint32_t template_height = 0;
  uint32_t footer_height = 0;
  uint64_t pixel_hash = 0; ///< FNV-1a of the RGBA canvas before encoding
};

/**
 * @brief Poster compositor
 *
 * Holds only immutable state (config and shared fonts), so one engine can
 * serve concurrent calls. Each call owns all of its intermediate buffers.
 */
class Engine {
public:
  /**
   * @brief Load fonts and build an engine
   * @return FontResourceError if any configured font is unusable
   */
  [[nodiscard]] static Result<Engine> create(const PosterConfig &config);

  /// Build from an already loaded font set
  Engine(PosterConfig config, std::shared_ptr<const Text::FontSet> fonts);

  ~Engine();

  // Move-only semantics
  Engine(Engine &&) noexcept;
  Engine &operator=(Engine &&) noexcept;
  Engine(const Engine &) = delete;
  Engine &operator=(const Engine &) = delete;

  /**
   * @brief Compose a poster in memory
   * @param request Inputs; output_path is ignored
   */
  [[nodiscard]] Result<ComposedPoster>
  render_poster(const PosterRequest &request) const;

  /**
   * @brief Compose, encode as JPEG and write to request.output_path
   *
   * On failure nothing is left at the output path.
   */
  [[nodiscard]] Result<PosterOutput>
  assemble_poster(const PosterRequest &request) const;

  /// Compose and return the encoded JPEG bytes
  [[nodiscard]] Result<std::vector<uint8_t>>
  assemble_poster_bytes(const PosterRequest &request) const;

  [[nodiscard]] const PosterConfig &config() const;

private:
  struct Impl;
  std::unique_ptr<Impl> pimpl_;
};

} // namespace PosterEngine
