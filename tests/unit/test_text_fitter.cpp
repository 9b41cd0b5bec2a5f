#include "text/markup.hpp"
#include "text/text_fitter.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

using namespace PosterEngine::Text;

namespace {

TextFields fields(std::string name, std::string designation,
                  std::string phone = "9876543210") {
  return {std::move(name), resolve_display_role("", designation),
          std::move(phone)};
}

} // namespace

TEST(NormalizeDesignation, WealthKeywordWins) {
  EXPECT_EQ(normalize_designation("senior wealth advisor", "WealthPlus"),
            "Wealth Manager | WealthPlus");
  EXPECT_EQ(normalize_designation("Wealth and Health", "WealthPlus"),
            "Wealth Manager | WealthPlus");
}

TEST(NormalizeDesignation, HealthKeywordCaseInsensitive) {
  EXPECT_EQ(normalize_designation("HEALTH Consultant", "WealthPlus"),
            "Health Insurance Advisor | WealthPlus");
}

TEST(NormalizeDesignation, CollapsesWhitespace) {
  EXPECT_EQ(normalize_designation("  Sales \t  Lead ", "WealthPlus"),
            "Sales Lead | WealthPlus");
}

TEST(NormalizeDesignation, BlankBecomesNotAvailable) {
  EXPECT_EQ(normalize_designation("", "WealthPlus"), "N/A | WealthPlus");
  EXPECT_EQ(normalize_designation("   \n", "WealthPlus"), "N/A | WealthPlus");
}

TEST(ResolveDisplayRole, TeamNameWins) {
  DisplayRole role = resolve_display_role("Alpha Squad", "Wealth Advisor");
  ASSERT_TRUE(std::holds_alternative<Team>(role));
  EXPECT_EQ(format_role(role, "WealthPlus"), "Alpha Squad");
}

TEST(ResolveDisplayRole, LastTeamTokenInDesignation) {
  DisplayRole role =
      resolve_display_role("", "Advisor, Team: North, Team: South");
  ASSERT_TRUE(std::holds_alternative<Team>(role));
  EXPECT_EQ(std::get<Team>(role).label, "Team: South");
}

TEST(ResolveDisplayRole, PlainDesignation) {
  DisplayRole role = resolve_display_role("  ", "Relationship Manager");
  ASSERT_TRUE(std::holds_alternative<Designation>(role));
  EXPECT_EQ(format_role(role, "WealthPlus"),
            "Relationship Manager | WealthPlus");
}

TEST(FitText, BuildsFourLines) {
  FittedText fitted =
      fit_text(fields("Asha Rao", "wealth"), TextContent{}, 428, 18);

  EXPECT_EQ(fitted.lines[0], "Asha Rao");
  EXPECT_EQ(fitted.lines[RoleLine], "Wealth Manager | WealthPlus");
  EXPECT_EQ(fitted.lines[2], TextContent{}.tagline);
  EXPECT_EQ(fitted.lines[3], "Phone: 9876543210");
}

TEST(FitText, EscapesMarkup) {
  FittedText fitted =
      fit_text(fields("Tom & <Jerry>", "Advisor"), TextContent{}, 428, 18);
  EXPECT_EQ(fitted.lines[0], "Tom &amp; &lt;Jerry&gt;");
  EXPECT_EQ(unescape_markup(fitted.lines[0]), "Tom & <Jerry>");
}

TEST(FitText, EscapesEveryLine) {
  TextContent content;
  content.tagline = "Fast & \"Friendly\"";

  FittedText by_designation = fit_text(
      fields("O'Neil", "Sales \"A\" & <B>", "<1> & '2'"), content, 428, 18);
  EXPECT_EQ(by_designation.lines[0], "O&apos;Neil");
  EXPECT_EQ(by_designation.lines[RoleLine],
            "Sales &quot;A&quot; &amp; &lt;B&gt; | WealthPlus");
  EXPECT_EQ(by_designation.lines[2], "Fast &amp; &quot;Friendly&quot;");
  EXPECT_EQ(by_designation.lines[3], "Phone: &lt;1&gt; &amp; &apos;2&apos;");

  TextFields team{"Asha", resolve_display_role("R&D <North> 'Q'", "Advisor"),
                  "1"};
  FittedText by_team = fit_text(team, content, 428, 18);
  EXPECT_EQ(by_team.lines[RoleLine], "R&amp;D &lt;North&gt; &apos;Q&apos;");
}

TEST(FitText, KeepsBaseSizeWhenTextFits) {
  FittedText fitted =
      fit_text(fields("Asha Rao", "wealth"), TextContent{}, 428, 18);
  EXPECT_EQ(fitted.font_size_px, 18);
  EXPECT_EQ(fitted.line_height_px, 27);
}

TEST(FitText, RaisesSmallBaseToStartSize) {
  FittedText fitted = fit_text(fields("A", "B"), TextContent{}, 2000, 10);
  EXPECT_EQ(fitted.font_size_px, Fit::MinStartFontSize);
}

TEST(FitText, ShrinksByEightPercentSteps) {
  // Tagline is the longest line (41 codepoints): 18px needs 405.9px,
  // 16px needs 360.8px
  FittedText fitted =
      fit_text(fields("Asha Rao", "wealth"), TextContent{}, 370, 18);
  EXPECT_EQ(fitted.font_size_px, 16);
  EXPECT_EQ(fitted.line_height_px, 24);
}

TEST(FitText, StopsAtMinimumSize) {
  FittedText fitted = fit_text(fields(std::string(200, 'W'), "Advisor"),
                               TextContent{}, 200, 18);
  EXPECT_EQ(fitted.font_size_px, Fit::MinFontSize);
  EXPECT_EQ(fitted.line_height_px, 18);
}

TEST(FitText, TinyWidthStillProducesMinimumSize) {
  FittedText fitted = fit_text(fields("Asha", "Advisor"), TextContent{}, 0, 18);
  EXPECT_EQ(fitted.font_size_px, Fit::MinFontSize);
}

TEST(FitText, NarrowerBoxNeverGetsLargerFont) {
  const TextFields f = fields("Venkata Subramanian Iyer", "Health advisor");
  int previous = 0;
  for (int width = 100; width <= 900; width += 25) {
    int size = fit_text(f, TextContent{}, width, 18).font_size_px;
    EXPECT_GE(size, previous) << "width " << width;
    previous = size;
  }
}

TEST(FitText, TeamLineShownVerbatim) {
  TextFields f{"Asha", resolve_display_role("Alpha Squad", ""), "1"};
  FittedText fitted = fit_text(f, TextContent{}, 428, 18);
  EXPECT_EQ(fitted.lines[RoleLine], "Alpha Squad");
}

TEST(EstimateLineWidth, CountsCodepoints) {
  EXPECT_DOUBLE_EQ(estimate_line_width("abc", 10), 16.5);
  // U+2714 U+FE0F is two codepoints, six bytes
  EXPECT_DOUBLE_EQ(estimate_line_width("✔️", 20), 22.0);
}

TEST(Markup, EscapeAndUnescape) {
  const std::string raw = "a&b<c>\"d'";
  EXPECT_EQ(escape_markup("a&b"), "a&amp;b");
  EXPECT_EQ(unescape_markup(escape_markup(raw)), raw);
}

TEST(Markup, DecodeUtf8) {
  std::u32string decoded = decode_utf8("Aé✔");
  ASSERT_EQ(decoded.size(), 3u);
  EXPECT_EQ(static_cast<uint32_t>(decoded[0]), 0x41u);
  EXPECT_EQ(static_cast<uint32_t>(decoded[1]), 0xE9u);
  EXPECT_EQ(static_cast<uint32_t>(decoded[2]), 0x2714u);
}

TEST(Markup, MalformedUtf8BecomesReplacement) {
  std::u32string decoded = decode_utf8(std::string("a\xFF" "b"));
  ASSERT_EQ(decoded.size(), 3u);
  EXPECT_EQ(static_cast<uint32_t>(decoded[1]), 0xFFFDu);
  EXPECT_TRUE(is_invisible_modifier(U'\uFE0F'));
  EXPECT_FALSE(is_invisible_modifier(U'\u2714'));
}
