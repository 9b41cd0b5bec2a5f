#pragma once
/**
 * @file result.hpp
 * @brief Stage-tagged error type and Result<T> for the poster pipeline
 *
 * Every pipeline stage reports failure through PosterError so the caller
 * can tell bad input from a broken rendering setup from a failed write.
 */

#include <new>
#include <string>
#include <utility>

namespace PosterEngine {

/// Error taxonomy
enum class ErrorKind {
  InputValidation, ///< Missing field or unreadable input path
  Decode,          ///< Input bytes are not a decodable image
  FontResource,    ///< Font file missing, unreadable or lacking coverage
  EncodeOrWrite,   ///< Output could not be encoded or written
  Config           ///< Configuration or manifest could not be parsed
};

/// Pipeline stage that produced the error
enum class Stage {
  Validation,
  Config,
  FontLoad,
  TemplateDecode,
  PhotoDecode,
  LogoDecode,
  TextRender,
  Encode,
  Write
};

[[nodiscard]] const char *to_string(ErrorKind kind) noexcept;
[[nodiscard]] const char *to_string(Stage stage) noexcept;

/// Error for poster operations
struct PosterError {
  ErrorKind kind = ErrorKind::InputValidation;
  Stage stage = Stage::Validation;
  std::string subject; ///< Offending field name or path
  std::string message;

  /// "[stage] Kind: message (subject)"
  [[nodiscard]] std::string describe() const;

  static PosterError input(std::string subject, std::string message) {
    return {ErrorKind::InputValidation, Stage::Validation, std::move(subject),
            std::move(message)};
  }
  static PosterError decode(Stage stage, std::string subject,
                            std::string message) {
    return {ErrorKind::Decode, stage, std::move(subject), std::move(message)};
  }
  static PosterError font(std::string subject, std::string message) {
    return {ErrorKind::FontResource, Stage::FontLoad, std::move(subject),
            std::move(message)};
  }
  static PosterError output(Stage stage, std::string subject,
                            std::string message) {
    return {ErrorKind::EncodeOrWrite, stage, std::move(subject),
            std::move(message)};
  }
  static PosterError config(std::string subject, std::string message) {
    return {ErrorKind::Config, Stage::Config, std::move(subject),
            std::move(message)};
  }
};

/**
 * @brief Value-or-error result
 *
 * Move-only; holds either a T or a PosterError.
 */
template <typename T> class Result {
public:
  // Success constructor
  Result(T value) : value_(std::move(value)), has_value_(true) {}

  // Error constructor
  Result(PosterError error) : error_(std::move(error)), has_value_(false) {}

  Result(Result &&other) noexcept : has_value_(other.has_value_) {
    if (has_value_) {
      new (&value_) T(std::move(other.value_));
    } else {
      new (&error_) PosterError(std::move(other.error_));
    }
  }

  Result &operator=(Result &&other) noexcept {
    if (this != &other) {
      destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        new (&value_) T(std::move(other.value_));
      } else {
        new (&error_) PosterError(std::move(other.error_));
      }
    }
    return *this;
  }

  ~Result() { destroy(); }

  Result(const Result &) = delete;
  Result &operator=(const Result &) = delete;

  bool has_value() const { return has_value_; }
  explicit operator bool() const { return has_value_; }

  T &value() { return value_; }
  const T &value() const { return value_; }
  T &operator*() { return value(); }
  const T &operator*() const { return value(); }
  T *operator->() { return &value_; }
  const T *operator->() const { return &value_; }

  PosterError &error() { return error_; }
  const PosterError &error() const { return error_; }

private:
  void destroy() {
    if (has_value_) {
      value_.~T();
    } else {
      error_.~PosterError();
    }
  }

  union {
    T value_;
    PosterError error_;
  };
  bool has_value_;
};

} // namespace PosterEngine
