#include "engine/batch.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

using namespace PosterEngine;
using PosterEngine::Testing::TempDir;

TEST(PosterFileName, SanitizesName) {
  EXPECT_EQ(poster_file_name(0, "Asha Rao"), "final_0_Asha_Rao.jpeg");
  EXPECT_EQ(poster_file_name(3, "  Tom \t Lee "), "final_3__Tom_Lee_.jpeg");
  EXPECT_EQ(poster_file_name(1, "a/b\\c:d"), "final_1_abcd.jpeg");
  EXPECT_EQ(poster_file_name(2, ""), "final_2_poster.jpeg");
  EXPECT_EQ(poster_file_name(2, ".."), "final_2_poster.jpeg");
}

TEST(BatchManifest, ParsesRecipients) {
  BatchManifest manifest = BatchManifest::from_json(R"({
    "template": "template.jpg",
    "logo": "/shared/logo.png",
    "output_dir": "out",
    "recipients": [
      {"name": "Asha", "designation": "wealth", "phone": "1", "photo": "a.jpg"},
      {"name": "Ravi", "team_name": "Alpha Squad", "photo": "/p/r.jpg"}
    ]
  })",
                                                    "/data");

  EXPECT_EQ(manifest.template_path.string(), "/data/template.jpg");
  EXPECT_EQ(manifest.logo_path.string(), "/shared/logo.png");
  EXPECT_EQ(manifest.output_dir.string(), "/data/out");
  ASSERT_EQ(manifest.recipients.size(), 2u);
  EXPECT_EQ(manifest.recipients[0].name, "Asha");
  EXPECT_EQ(manifest.recipients[0].photo.string(), "/data/a.jpg");
  EXPECT_EQ(manifest.recipients[1].team_name, "Alpha Squad");
  EXPECT_EQ(manifest.recipients[1].designation, "");
  EXPECT_EQ(manifest.recipients[1].photo.string(), "/p/r.jpg");
}

TEST(BatchManifest, RequiresRecipients) {
  EXPECT_THROW((void)BatchManifest::from_json(R"({"template": "t.jpg"})"),
               std::runtime_error);
}

TEST(BatchManifest, LoadReportsConfigErrors) {
  TempDir dir;
  Testing::write_text(dir / "m.json", "[1, 2");
  auto manifest = BatchManifest::load(dir / "m.json");
  ASSERT_FALSE(manifest);
  EXPECT_EQ(manifest.error().kind, ErrorKind::Config);
}

class RunBatchTest : public ::testing::Test {
protected:
  void SetUp() override {
    if (!Testing::test_fonts_available()) {
      GTEST_SKIP() << "Test fonts not found in " << PE_TEST_FONT_DIR;
    }

    ASSERT_TRUE(Testing::write_jpeg(
        dir_ / "template.jpg",
        Testing::make_test_image(400, 300, {200, 220, 240, 255},
                                 {30, 60, 90, 255})));
    ASSERT_TRUE(Testing::write_png(
        dir_ / "logo.png", ImageBuffer::filled(60, 30, Color::Colors::Divider)));
    ASSERT_TRUE(Testing::write_jpeg(
        dir_ / "photo.jpg", ImageBuffer::filled(50, 50, {180, 140, 120, 255})));

    PosterConfig cfg;
    cfg.fonts = Testing::test_fonts();
    cfg.verbose = false;
    auto engine = Engine::create(cfg);
    ASSERT_TRUE(engine) << engine.error().describe();
    engine_ = std::make_unique<Engine>(std::move(*engine));
  }

  TempDir dir_;
  std::unique_ptr<Engine> engine_;
};

TEST_F(RunBatchTest, GeneratesSkipsAndRecordsFailures) {
  BatchManifest manifest;
  manifest.template_path = dir_ / "template.jpg";
  manifest.logo_path = dir_ / "logo.png";
  manifest.output_dir = dir_ / "posters";

  manifest.recipients.push_back(
      {"Asha Rao", "Wealth advisor", "111", "", dir_ / "photo.jpg"});
  manifest.recipients.push_back(
      {"No Photo", "Advisor", "222", "", dir_ / "missing.jpg"});
  manifest.recipients.push_back(
      {"No Role", "", "333", "", dir_ / "photo.jpg"});

  BatchReport report = run_batch(*engine_, manifest);

  ASSERT_EQ(report.generated.size(), 1u);
  EXPECT_EQ(report.generated[0].string(),
            (dir_ / "posters" / "final_0_Asha_Rao.jpeg").string());
  EXPECT_TRUE(std::filesystem::exists(report.generated[0]));

  ASSERT_EQ(report.skipped.size(), 1u);
  EXPECT_EQ(report.skipped[0], "No Photo");

  ASSERT_EQ(report.failures.size(), 1u);
  EXPECT_EQ(report.failures[0].name, "No Role");
  EXPECT_EQ(report.failures[0].error.kind, ErrorKind::InputValidation);
  EXPECT_EQ(report.failures[0].error.subject, "designation");

  EXPECT_EQ(report.attempted(), 2u);
  EXPECT_FALSE(std::filesystem::exists(dir_ / "posters" / "final_2_No_Role.jpeg"));
}

TEST_F(RunBatchTest, QuietEngineKeepsStdoutClean) {
  BatchManifest manifest;
  manifest.template_path = dir_ / "template.jpg";
  manifest.logo_path = dir_ / "logo.png";
  manifest.output_dir = dir_;
  manifest.recipients.push_back(
      {"Asha Rao", "Wealth advisor", "111", "", dir_ / "photo.jpg"});

  testing::internal::CaptureStdout();
  BatchReport report = run_batch(*engine_, manifest);
  const std::string printed = testing::internal::GetCapturedStdout();

  EXPECT_EQ(report.generated.size(), 1u);
  EXPECT_EQ(printed, "");
}
