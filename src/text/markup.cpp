/**
 * @file markup.cpp
 * @brief Markup escaping and UTF-8 decoding
 */

#include "text/markup.hpp"

#include <array>
#include <utility>

namespace PosterEngine::Text {

namespace {

constexpr std::array<std::pair<std::string_view, char>, 5> kEntities{{
    {"&amp;", '&'},
    {"&lt;", '<'},
    {"&gt;", '>'},
    {"&quot;", '"'},
    {"&apos;", '\''},
}};

constexpr char32_t kReplacement = 0xFFFD;

} // anonymous namespace

std::string escape_markup(std::string_view raw) {
  std::string out;
  out.reserve(raw.size());
  for (char c : raw) {
    switch (c) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    case '\'':
      out += "&apos;";
      break;
    default:
      out += c;
    }
  }
  return out;
}

std::string unescape_markup(std::string_view escaped) {
  std::string out;
  out.reserve(escaped.size());
  size_t i = 0;
  while (i < escaped.size()) {
    bool matched = false;
    if (escaped[i] == '&') {
      for (const auto &[entity, ch] : kEntities) {
        if (escaped.substr(i, entity.size()) == entity) {
          out += ch;
          i += entity.size();
          matched = true;
          break;
        }
      }
    }
    if (!matched) {
      out += escaped[i++];
    }
  }
  return out;
}

std::u32string decode_utf8(std::string_view utf8) {
  std::u32string out;
  out.reserve(utf8.size());

  size_t i = 0;
  while (i < utf8.size()) {
    auto b0 = static_cast<unsigned char>(utf8[i]);
    size_t len = 0;
    char32_t cp = 0;

    if (b0 < 0x80) {
      len = 1;
      cp = b0;
    } else if ((b0 & 0xE0) == 0xC0) {
      len = 2;
      cp = b0 & 0x1F;
    } else if ((b0 & 0xF0) == 0xE0) {
      len = 3;
      cp = b0 & 0x0F;
    } else if ((b0 & 0xF8) == 0xF0) {
      len = 4;
      cp = b0 & 0x07;
    } else {
      out += kReplacement;
      ++i;
      continue;
    }

    if (i + len > utf8.size()) {
      out += kReplacement;
      break;
    }

    bool valid = true;
    for (size_t k = 1; k < len; ++k) {
      auto b = static_cast<unsigned char>(utf8[i + k]);
      if ((b & 0xC0) != 0x80) {
        valid = false;
        break;
      }
      cp = (cp << 6) | (b & 0x3F);
    }

    if (!valid) {
      out += kReplacement;
      ++i;
      continue;
    }

    out += cp;
    i += len;
  }
  return out;
}

std::size_t count_codepoints(std::string_view utf8) {
  return decode_utf8(utf8).size();
}

} // namespace PosterEngine::Text
