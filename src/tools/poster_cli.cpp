/**
 * @file poster_cli.cpp
 * @brief CLI entry point for poster generation
 *
 * Usage:
 *   poster_cli --config cfg.json --template t.jpg --logo l.png
 *              --photo p.jpg --name NAME [--designation D] [--team T]
 *              [--phone P] --out poster.jpg
 *   poster_cli --config cfg.json --batch manifest.json
 *   poster_cli --circle in.jpg out.png SIZE
 *   poster_cli --hash image.jpg
 *   poster_cli --help
 */

#include "core/frame_hash.hpp"
#include "engine/batch.hpp"
#include "engine/engine.hpp"
#include "image/circular_mask.hpp"
#include "image/codec.hpp"

#include <charconv>
#include <iomanip>
#include <iostream>
#include <string>
#include <unordered_map>

using namespace PosterEngine;

constexpr const char *COLOR_RESET = "\033[0m";
constexpr const char *COLOR_GREEN = "\033[32m";
constexpr const char *COLOR_RED = "\033[31m";
constexpr const char *COLOR_YELLOW = "\033[33m";
constexpr const char *COLOR_CYAN = "\033[36m";
constexpr const char *COLOR_BOLD = "\033[1m";

constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

void print_usage() {
  std::cout << COLOR_BOLD << "Usage:" << COLOR_RESET << std::endl;
  std::cout << "  poster_cli --config <cfg.json> --template <img> --logo <img>"
            << std::endl;
  std::cout << "             --photo <img> --name <name> [--designation <d>]"
            << std::endl;
  std::cout << "             [--team <t>] [--phone <p>] --out <poster.jpg>"
            << std::endl;
  std::cout << "      Compose one poster\n" << std::endl;
  std::cout << "  poster_cli --config <cfg.json> --batch <manifest.json>"
            << std::endl;
  std::cout << "      Compose one poster per manifest recipient\n" << std::endl;
  std::cout << "  poster_cli --circle <in> <out.png> <size>" << std::endl;
  std::cout << "      Crop an image to a circle\n" << std::endl;
  std::cout << "  poster_cli --hash <img>" << std::endl;
  std::cout << "      Print the FNV-1a hash of the decoded pixels\n"
            << std::endl;
  std::cout << "  poster_cli --help" << std::endl;
  std::cout << "      Show this help message\n" << std::endl;
}

int report_error(const PosterError &error) {
  std::cerr << COLOR_RED << "✗ " << error.describe() << COLOR_RESET
            << std::endl;
  return EXIT_FAILED;
}

/// Collect "--key value" pairs
bool parse_options(int argc, char *argv[],
                   std::unordered_map<std::string, std::string> &options) {
  for (int i = 1; i < argc; ++i) {
    std::string key = argv[i];
    if (key.rfind("--", 0) != 0 || i + 1 >= argc) {
      std::cerr << COLOR_RED << "Unexpected argument: " << key << COLOR_RESET
                << std::endl;
      return false;
    }
    options[key.substr(2)] = argv[++i];
  }
  return true;
}

std::string option(const std::unordered_map<std::string, std::string> &options,
                   const std::string &key) {
  auto it = options.find(key);
  return it == options.end() ? std::string() : it->second;
}

int run_circle(int argc, char *argv[]) {
  if (argc != 5) {
    print_usage();
    return EXIT_USAGE;
  }

  const std::string size_arg = argv[4];
  uint32_t size = 0;
  auto [ptr, ec] =
      std::from_chars(size_arg.data(), size_arg.data() + size_arg.size(), size);
  if (ec != std::errc() || ptr != size_arg.data() + size_arg.size()) {
    std::cerr << COLOR_RED << "Invalid size: " << size_arg << COLOR_RESET
              << std::endl;
    return EXIT_USAGE;
  }

  auto written = process_circular_image(argv[2], argv[3], size);
  if (!written) {
    return report_error(written.error());
  }
  std::cout << COLOR_GREEN << "✓ Circle written: " << COLOR_RESET
            << written->string() << std::endl;
  return 0;
}

int run_hash(int argc, char *argv[]) {
  if (argc != 3) {
    print_usage();
    return EXIT_USAGE;
  }

  auto image = Codec::decode_file(argv[2], Stage::TemplateDecode);
  if (!image) {
    return report_error(image.error());
  }
  std::cout << image->width << "x" << image->height << " 0x" << std::hex
            << std::setw(16) << std::setfill('0') << hash_pixels(image->data)
            << std::dec << std::endl;
  return 0;
}

int run_batch_mode(const Engine &engine, const std::string &manifest_path) {
  auto manifest = BatchManifest::load(manifest_path);
  if (!manifest) {
    return report_error(manifest.error());
  }

  BatchReport report = run_batch(engine, *manifest);

  std::cout << std::endl << COLOR_BOLD << "Results:" << COLOR_RESET
            << std::endl;
  for (const auto &path : report.generated) {
    std::cout << COLOR_GREEN << "  ✓ " << COLOR_RESET << path.string()
              << std::endl;
  }
  for (const auto &name : report.skipped) {
    std::cout << COLOR_YELLOW << "  - " << name << " (no photo)" << COLOR_RESET
              << std::endl;
  }
  for (const auto &failure : report.failures) {
    std::cout << COLOR_RED << "  ✗ " << failure.name << COLOR_RESET
              << std::endl;
    std::cout << COLOR_YELLOW << "      → " << failure.error.describe()
              << COLOR_RESET << std::endl;
  }

  return report.failures.empty() ? 0 : EXIT_FAILED;
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    print_usage();
    return EXIT_USAGE;
  }

  std::string mode = argv[1];

  if (mode == "--help" || mode == "-h") {
    print_usage();
    return 0;
  }
  if (mode == "--circle") {
    return run_circle(argc, argv);
  }
  if (mode == "--hash") {
    return run_hash(argc, argv);
  }

  std::unordered_map<std::string, std::string> options;
  if (!parse_options(argc, argv, options)) {
    print_usage();
    return EXIT_USAGE;
  }

  const std::string config_path = option(options, "config");
  if (config_path.empty()) {
    std::cerr << COLOR_RED << "Error: --config is required" << COLOR_RESET
              << std::endl;
    print_usage();
    return EXIT_USAGE;
  }

  auto config = PosterConfig::load(config_path);
  if (!config) {
    return report_error(config.error());
  }

  auto engine = Engine::create(*config);
  if (!engine) {
    return report_error(engine.error());
  }

  if (options.count("batch")) {
    return run_batch_mode(*engine, option(options, "batch"));
  }

  PosterRequest request;
  request.template_path = option(options, "template");
  request.logo_path = option(options, "logo");
  request.output_path = option(options, "out");
  request.person.name = option(options, "name");
  request.person.designation = option(options, "designation");
  request.person.team_name = option(options, "team");
  request.person.phone = option(options, "phone");
  request.person.photo = option(options, "photo");

  std::cout << COLOR_CYAN << "Template: " << COLOR_RESET
            << request.template_path.string() << std::endl;
  std::cout << COLOR_CYAN << "Output:   " << COLOR_RESET
            << request.output_path.string() << std::endl;

  auto output = engine->assemble_poster(request);
  if (!output) {
    return report_error(output.error());
  }

  std::cout << COLOR_GREEN << COLOR_BOLD << "✓ Poster written: " << COLOR_RESET
            << output->path.string() << " (" << output->width << "x"
            << output->height << ")" << std::endl;
  return 0;
}
