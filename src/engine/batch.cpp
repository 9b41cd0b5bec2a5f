/**
 * @file batch.cpp
 * @brief Batch manifest parsing and generation loop
 */

#include "engine/batch.hpp"

#include <cctype>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <system_error>

using json = nlohmann::json;

namespace PosterEngine {

namespace {

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

PersonInfo parse_person(const json &j, const std::filesystem::path &base_dir) {
  PersonInfo person;
  person.name = j.value("name", "");
  person.designation = j.value("designation", "");
  person.phone = j.value("phone", "");
  person.team_name = j.value("team_name", "");
  person.photo = resolve_path(j.value("photo", ""), base_dir);
  return person;
}

} // anonymous namespace

BatchManifest BatchManifest::from_json(const std::string &json_str,
                                       const std::filesystem::path &base_dir) {
  json j = json::parse(json_str);

  BatchManifest manifest;
  manifest.template_path = resolve_path(j.value("template", ""), base_dir);
  manifest.logo_path = resolve_path(j.value("logo", ""), base_dir);
  manifest.output_dir = resolve_path(j.value("output_dir", "."), base_dir);

  if (!j.contains("recipients") || !j["recipients"].is_array()) {
    throw std::runtime_error("Manifest needs a 'recipients' array");
  }
  for (const auto &person_json : j["recipients"]) {
    manifest.recipients.push_back(parse_person(person_json, base_dir));
  }

  return manifest;
}

Result<BatchManifest> BatchManifest::load(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return PosterError::config(path.string(), "cannot open manifest file");
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

std::string poster_file_name(size_t index, const std::string &person_name) {
  std::string safe;
  bool in_space = false;
  for (char c : person_name) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (!in_space)
        safe += '_';
      in_space = true;
      continue;
    }
    in_space = false;
    if (c == '/' || c == '\\' || c == ':') {
      continue;
    }
    safe += c;
  }
  if (safe.empty() || safe == "." || safe == "..") {
    safe = "poster";
  }
  return "final_" + std::to_string(index) + "_" + safe + ".jpeg";
}

BatchReport run_batch(const Engine &engine, const BatchManifest &manifest) {
  BatchReport report;

  std::error_code ec;
  std::filesystem::create_directories(manifest.output_dir, ec);
  if (ec) {
    std::cerr << "⚠️ Cannot create output directory "
              << manifest.output_dir.string() << ": " << ec.message()
              << std::endl;
  }

  for (size_t i = 0; i < manifest.recipients.size(); ++i) {
    const PersonInfo &person = manifest.recipients[i];

    if (person.photo.empty() ||
        !std::filesystem::is_regular_file(person.photo, ec)) {
      std::cerr << "⚠️ Skipping poster for " << person.name
                << ": invalid or missing photo" << std::endl;
      report.skipped.push_back(person.name);
      continue;
    }

    PosterRequest request;
    request.template_path = manifest.template_path;
    request.logo_path = manifest.logo_path;
    request.person = person;
    request.output_path =
        manifest.output_dir / poster_file_name(i, person.name);

    auto result = engine.assemble_poster(request);
    if (result) {
      report.generated.push_back(result->path);
    } else {
      report.failures.push_back({person.name, result.error()});
    }
  }

  if (engine.config().verbose) {
    std::cout << "📦 Batch done: " << report.generated.size()
              << " generated, " << report.skipped.size() << " skipped, "
              << report.failures.size() << " failed" << std::endl;
  }
  return report;
}

} // namespace PosterEngine
