/**
 * @file result.cpp
 * @brief Error naming and formatting
 */

#include "core/result.hpp"

namespace PosterEngine {

const char *to_string(ErrorKind kind) noexcept {
  switch (kind) {
  case ErrorKind::InputValidation:
    return "InputValidationError";
  case ErrorKind::Decode:
    return "DecodeError";
  case ErrorKind::FontResource:
    return "FontResourceError";
  case ErrorKind::EncodeOrWrite:
    return "EncodeOrWriteError";
  case ErrorKind::Config:
    return "ConfigError";
  }
  return "UnknownError";
}

const char *to_string(Stage stage) noexcept {
  switch (stage) {
  case Stage::Validation:
    return "validation";
  case Stage::Config:
    return "config";
  case Stage::FontLoad:
    return "font-load";
  case Stage::TemplateDecode:
    return "template-decode";
  case Stage::PhotoDecode:
    return "photo-decode";
  case Stage::LogoDecode:
    return "logo-decode";
  case Stage::TextRender:
    return "text-render";
  case Stage::Encode:
    return "encode";
  case Stage::Write:
    return "write";
  }
  return "unknown";
}

std::string PosterError::describe() const {
  std::string out = "[";
  out += to_string(stage);
  out += "] ";
  out += to_string(kind);
  out += ": ";
  out += message;
  if (!subject.empty()) {
    out += " (";
    out += subject;
    out += ")";
  }
  return out;
}

} // namespace PosterEngine
