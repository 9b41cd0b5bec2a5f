#pragma once
/**
 * @file batch.hpp
 * @brief Poster generation for a list of recipients
 */

#include "core/result.hpp"
#include "engine/engine.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace PosterEngine {

/// Shared inputs plus one PersonInfo per poster
struct BatchManifest {
  std::filesystem::path template_path;
  std::filesystem::path logo_path;
  std::filesystem::path output_dir;
  std::vector<PersonInfo> recipients;

  /**
   * @brief Parse from JSON string
   * @param base_dir Directory relative paths resolve against
   * @throws std::runtime_error / nlohmann::json::exception on bad input
   */
  static BatchManifest from_json(const std::string &json,
                                 const std::filesystem::path &base_dir = {});

  /// Read and parse a manifest file; errors become ErrorKind::Config
  [[nodiscard]] static Result<BatchManifest>
  load(const std::filesystem::path &path);
};

struct BatchFailure {
  std::string name;
  PosterError error;
};

struct BatchReport {
  std::vector<std::filesystem::path> generated;
  std::vector<std::string> skipped; ///< Recipients without a usable photo
  std::vector<BatchFailure> failures;

  [[nodiscard]] size_t attempted() const {
    return generated.size() + failures.size();
  }
};

/// "final_<index>_<name>.jpeg" with whitespace runs as '_' and no separators
[[nodiscard]] std::string poster_file_name(size_t index,
                                           const std::string &person_name);

/**
 * @brief Generate one poster per recipient
 *
 * Recipients with a missing photo are skipped; failures are recorded and
 * do not stop the batch.
 */
[[nodiscard]] BatchReport run_batch(const Engine &engine,
                                    const BatchManifest &manifest);

} // namespace PosterEngine
