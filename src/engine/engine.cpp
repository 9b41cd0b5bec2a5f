/**
 * @file engine.cpp
 * @brief Poster assembly pipeline
 */

#include "engine/engine.hpp"
#include "core/frame_hash.hpp"
#include "image/circular_mask.hpp"
#include "image/codec.hpp"
#include "text/footer_renderer.hpp"
#include "text/text_fitter.hpp"

#include <iostream>
#include <optional>
#include <system_error>

namespace PosterEngine {

namespace {

bool blank(const std::string &s) {
  return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

bool readable_file(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::is_regular_file(p, ec);
}

std::optional<PosterError> validate(const PosterRequest &request) {
  const PersonInfo &person = request.person;

  if (blank(person.name)) {
    return PosterError::input("name", "missing required field: name");
  }
  if (person.photo.empty()) {
    return PosterError::input("photo", "missing required field: photo");
  }
  if (blank(person.designation) && blank(person.team_name)) {
    return PosterError::input(
        "designation", "missing required field: designation or team name");
  }

  if (request.template_path.empty()) {
    return PosterError::input("template", "missing template image path");
  }
  if (!readable_file(request.template_path)) {
    return PosterError::input(request.template_path.string(),
                              "template image not found");
  }
  if (request.logo_path.empty()) {
    return PosterError::input("logo", "missing logo image path");
  }
  if (!readable_file(request.logo_path)) {
    return PosterError::input(request.logo_path.string(),
                              "logo image not found");
  }
  if (!readable_file(person.photo)) {
    return PosterError::input(person.photo.string(), "photo not found");
  }
  return std::nullopt;
}

/// Top offset that centers an element of height h in the footer
int center_in_footer(const Geometry &g, int h) {
  return (g.footer_height - h) / 2;
}

} // anonymous namespace

// Engine implementation
struct Engine::Impl {
  PosterConfig config;
  std::shared_ptr<const Text::FontSet> fonts;
  Text::FooterRenderer footer;

  Impl(PosterConfig cfg, std::shared_ptr<const Text::FontSet> font_set)
      : config(std::move(cfg)), fonts(std::move(font_set)),
        footer(fonts, config.palette.ink) {}

  void log(const std::string &message) const {
    if (config.verbose) {
      std::cout << message << std::endl;
    }
  }
};

Result<Engine> Engine::create(const PosterConfig &config) {
  auto fonts = Text::FontSet::load(config.fonts, config.verbose);
  if (!fonts) {
    std::cerr << "❌ Poster engine unavailable: " << fonts.error().describe()
              << std::endl;
    return std::move(fonts.error());
  }
  return Engine(config, std::move(*fonts));
}

Engine::Engine(PosterConfig config, std::shared_ptr<const Text::FontSet> fonts)
    : pimpl_(std::make_unique<Impl>(std::move(config), std::move(fonts))) {
  pimpl_->log("✅ Poster engine ready (text backend: " +
              pimpl_->footer.backend_name() + ")");
}

Engine::~Engine() = default;

Engine::Engine(Engine &&) noexcept = default;
Engine &Engine::operator=(Engine &&) noexcept = default;

const PosterConfig &Engine::config() const { return pimpl_->config; }

Result<ComposedPoster> Engine::render_poster(const PosterRequest &request) const {
  const PosterConfig &cfg = pimpl_->config;
  const PersonInfo &person = request.person;

  if (auto invalid = validate(request)) {
    return std::move(*invalid);
  }

  pimpl_->log("🖼️ Composing poster for " + person.name);

  // Template at working width
  auto decoded_template =
      Codec::decode_file(request.template_path, Stage::TemplateDecode);
  if (!decoded_template) {
    return std::move(decoded_template.error());
  }
  auto resized_template = Codec::resize_to_width(
      *decoded_template, cfg.working_width, Stage::TemplateDecode);
  if (!resized_template) {
    return std::move(resized_template.error());
  }
  const ImageBuffer &tmpl = *resized_template;

  const Geometry plan = plan_geometry(static_cast<int>(tmpl.width));

  // Footer text
  Text::TextFields fields{
      person.name,
      Text::resolve_display_role(person.team_name, person.designation),
      person.phone};
  const Text::FittedText fitted =
      Text::fit_text(fields, cfg.text, plan.text_width, plan.font_size_base);

  auto text = pimpl_->footer.render(fitted, plan.text_width, plan.footer_height);
  if (!text) {
    return std::move(text.error());
  }

  // Photo and logo
  auto photo = circular_crop_file(person.photo,
                                  static_cast<uint32_t>(plan.photo_size),
                                  Stage::PhotoDecode);
  if (!photo) {
    return std::move(photo.error());
  }

  auto decoded_logo = Codec::decode_file(request.logo_path, Stage::LogoDecode);
  if (!decoded_logo) {
    return std::move(decoded_logo.error());
  }
  auto logo = Codec::contain_square(*decoded_logo,
                                    static_cast<uint32_t>(plan.logo_size),
                                    cfg.palette.footer_background,
                                    Stage::LogoDecode);
  if (!logo) {
    return std::move(logo.error());
  }

  const Geometry g = place_right_section(plan, text->measured_width);

  // Footer band
  ImageBuffer footer =
      ImageBuffer::filled(static_cast<uint32_t>(g.template_width),
                          static_cast<uint32_t>(g.footer_height),
                          cfg.palette.footer_background);
  footer.composite(*photo,
                   {g.photo_left, center_in_footer(g, g.photo_size)});
  footer.composite(text->layer,
                   {g.text_left,
                    center_in_footer(g, static_cast<int>(text->layer.height))});
  footer.fill_rect({g.line_x, center_in_footer(g, g.logo_size)},
                   {g.line_width, g.logo_size}, cfg.palette.divider);
  footer.composite(*logo, {g.logo_x, center_in_footer(g, g.logo_size)});

  // Final canvas
  ComposedPoster composed;
  composed.template_height = tmpl.height;
  composed.geometry = g;
  composed.font_size_px = fitted.font_size_px;
  composed.image = ImageBuffer::filled(
      tmpl.width, tmpl.height + static_cast<uint32_t>(g.footer_height),
      cfg.palette.canvas);
  composed.image.composite(tmpl, {0, 0});
  composed.image.composite(footer, {0, static_cast<int>(tmpl.height)});

  pimpl_->log("   Layout: " + std::to_string(composed.image.width) + "x" +
              std::to_string(composed.image.height) + ", footer " +
              std::to_string(g.footer_height) + "px, font " +
              std::to_string(fitted.font_size_px) + "px");
  return composed;
}

Result<std::vector<uint8_t>>
Engine::assemble_poster_bytes(const PosterRequest &request) const {
  auto composed = render_poster(request);
  if (!composed) {
    return std::move(composed.error());
  }
  return Codec::encode_jpeg(composed->image, pimpl_->config.jpeg_quality);
}

Result<PosterOutput> Engine::assemble_poster(const PosterRequest &request) const {
  if (request.output_path.empty()) {
    return PosterError::input("output", "missing output path");
  }

  auto composed = render_poster(request);
  if (!composed) {
    std::cerr << "❌ Poster for '" << request.person.name
              << "' failed: " << composed.error().describe() << std::endl;
    return std::move(composed.error());
  }

  auto jpeg = Codec::encode_jpeg(composed->image, pimpl_->config.jpeg_quality);
  if (!jpeg) {
    return std::move(jpeg.error());
  }

  auto written = Codec::write_file_atomic(request.output_path, *jpeg);
  if (!written) {
    std::cerr << "❌ " << written.error().describe() << std::endl;
    return std::move(written.error());
  }

  PosterOutput out;
  out.path = *written;
  out.width = composed->image.width;
  out.height = composed->image.height;
  out.template_height = composed->template_height;
  out.footer_height = static_cast<uint32_t>(composed->geometry.footer_height);
  out.pixel_hash = hash_pixels(composed->image.data);

  pimpl_->log("✅ Poster written: " + out.path.string());
  return out;
}

} // namespace PosterEngine
