/**
 * @file text_fitter.cpp
 * @brief Footer text content and fitting
 */

#include "text/text_fitter.hpp"
#include "text/markup.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>

namespace PosterEngine::Text {

namespace {

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)); }

std::string trim(std::string_view s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && is_space(s[begin]))
    ++begin;
  while (end > begin && is_space(s[end - 1]))
    --end;
  return std::string(s.substr(begin, end - begin));
}

std::string collapse_whitespace(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  bool in_space = false;
  for (char c : s) {
    if (is_space(c)) {
      if (!in_space)
        out += ' ';
      in_space = true;
    } else {
      out += c;
      in_space = false;
    }
  }
  return trim(out);
}

std::string to_lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

} // anonymous namespace

DisplayRole resolve_display_role(std::string_view team_name,
                                 std::string_view designation) {
  std::string team = trim(team_name);
  if (!team.empty()) {
    return Team{std::move(team)};
  }

  static const std::regex team_token("Team: ([^,]+)");
  const std::string text(designation);
  std::string last;
  for (auto it = std::sregex_iterator(text.begin(), text.end(), team_token);
       it != std::sregex_iterator(); ++it) {
    last = it->str(0);
  }

  last = trim(last);
  if (!last.empty()) {
    return Team{std::move(last)};
  }
  return Designation{text};
}

std::string normalize_designation(std::string_view raw,
                                  std::string_view brand) {
  const std::string suffix = " | " + std::string(brand);

  std::string collapsed = collapse_whitespace(raw);
  if (collapsed.empty()) {
    return "N/A" + suffix;
  }

  const std::string lower = to_lower(collapsed);
  if (lower.find("wealth") != std::string::npos) {
    return "Wealth Manager" + suffix;
  }
  if (lower.find("health") != std::string::npos) {
    return "Health Insurance Advisor" + suffix;
  }
  return collapsed + suffix;
}

std::string format_role(const DisplayRole &role, std::string_view brand) {
  if (const auto *team = std::get_if<Team>(&role)) {
    return trim(team->label);
  }
  return normalize_designation(std::get<Designation>(role).value, brand);
}

double estimate_line_width(std::string_view line, int font_size) {
  return static_cast<double>(count_codepoints(line)) * font_size *
         Fit::CharWidthFactor;
}

FittedText fit_text(const TextFields &fields, const TextContent &content,
                    int target_width, int requested_base_font_size) {
  FittedText fitted;
  fitted.lines = {
      escape_markup(fields.name),
      escape_markup(format_role(fields.role, content.brand)),
      escape_markup(content.tagline),
      escape_markup("Phone: " + fields.phone),
  };

  const double available =
      std::max(Fit::MinAvailableWidth, target_width - Fit::HorizontalPadding * 2);

  size_t longest = 0;
  for (const auto &line : fitted.lines) {
    longest = std::max(longest, count_codepoints(line));
  }

  auto fits = [&](int size) {
    return longest * size * Fit::CharWidthFactor <= available;
  };

  int size = std::max(requested_base_font_size, Fit::MinStartFontSize);
  while (size > Fit::MinFontSize && !fits(size)) {
    size = std::max(Fit::MinFontSize,
                    static_cast<int>(std::floor(size * Fit::ShrinkFactor)));
  }

  fitted.font_size_px = size;
  fitted.line_height_px =
      static_cast<int>(std::lround(size * Fit::LineHeightFactor));
  return fitted;
}

} // namespace PosterEngine::Text
