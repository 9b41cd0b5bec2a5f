#include "core/color.hpp"
#include "core/frame_hash.hpp"
#include "image/codec.hpp"
#include "image/image_buffer.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <array>

using namespace PosterEngine;
using PosterEngine::Testing::TempDir;

TEST(Color, ParseHex) {
  auto ink = Color::try_parse_hex("#292D6C");
  ASSERT_TRUE(ink.has_value());
  EXPECT_EQ(*ink, Color::Colors::FooterInk);

  auto shorthand = Color::try_parse_hex("fff");
  ASSERT_TRUE(shorthand.has_value());
  EXPECT_EQ(*shorthand, Color::Colors::White);

  EXPECT_FALSE(Color::try_parse_hex("#12345").has_value());
  EXPECT_FALSE(Color::try_parse_hex("#GG0000").has_value());
  EXPECT_FALSE(Color::try_parse_hex("").has_value());
}

TEST(Color, HexRoundTrip) {
  EXPECT_EQ(Color::to_hex(Color::Colors::Divider), "#1B75BB");
  EXPECT_EQ(Color::to_hex({1, 2, 3, 4}), "#01020304");
}

TEST(Color, BlendOver) {
  using Color::blend_over;
  EXPECT_EQ(blend_over(Color::Colors::Black, Color::Colors::White),
            Color::Colors::Black);
  EXPECT_EQ(blend_over(Color::Colors::Transparent, Color::Colors::White),
            Color::Colors::White);

  Color::RGBA half = blend_over({0, 0, 0, 128}, Color::Colors::White);
  EXPECT_EQ(half.a, 255);
  EXPECT_NEAR(half.r, 127, 1);
}

TEST(ImageBuffer, FilledAndAt) {
  ImageBuffer img = ImageBuffer::filled(3, 2, Color::Colors::Divider);
  EXPECT_EQ(img.data.size(), 24u);
  EXPECT_EQ(img.at(2, 1), Color::Colors::Divider);
  EXPECT_EQ(img.at(3, 0), Color::Colors::Transparent);
  EXPECT_TRUE(img.pixel(0, 2) == nullptr);
}

TEST(ImageBuffer, CompositeClipsAtEdges) {
  ImageBuffer canvas = ImageBuffer::filled(4, 4, Color::Colors::White);
  ImageBuffer layer = ImageBuffer::filled(3, 3, Color::Colors::Black);

  canvas.composite(layer, {-2, -2});

  EXPECT_EQ(canvas.at(0, 0), Color::Colors::Black);
  EXPECT_EQ(canvas.at(1, 0), Color::Colors::White);
  EXPECT_EQ(canvas.at(0, 1), Color::Colors::White);

  canvas.composite(layer, {3, 3});
  EXPECT_EQ(canvas.at(3, 3), Color::Colors::Black);
  EXPECT_EQ(canvas.at(2, 3), Color::Colors::White);
}

TEST(ImageBuffer, TransparentLayerLeavesCanvas) {
  ImageBuffer canvas = ImageBuffer::filled(4, 4, Color::Colors::FooterBackground);
  const uint64_t before = hash_pixels(canvas.data);
  canvas.composite(ImageBuffer::create(4, 4), {0, 0});
  EXPECT_EQ(hash_pixels(canvas.data), before);
}

TEST(ImageBuffer, FillRect) {
  ImageBuffer img = ImageBuffer::filled(10, 10, Color::Colors::White);
  img.fill_rect({8, 2}, {4, 3}, Color::Colors::Divider);

  EXPECT_EQ(img.at(8, 2), Color::Colors::Divider);
  EXPECT_EQ(img.at(9, 4), Color::Colors::Divider);
  EXPECT_EQ(img.at(7, 2), Color::Colors::White);
  EXPECT_EQ(img.at(9, 5), Color::Colors::White);
}

TEST(ImageBuffer, FlattenMakesOpaque) {
  ImageBuffer img = ImageBuffer::create(2, 2);
  img.flatten(Color::Colors::FooterBackground);
  EXPECT_EQ(img.at(1, 1), Color::Colors::FooterBackground);
}

TEST(FrameHash, DiffersOnSinglePixel) {
  ImageBuffer a = ImageBuffer::filled(8, 8, Color::Colors::White);
  ImageBuffer b = a;
  EXPECT_EQ(hash_pixels(a.data), hash_pixels(b.data));
  b.blend_pixel(3, 3, Color::Colors::Black);
  EXPECT_NE(hash_pixels(a.data), hash_pixels(b.data));
}

TEST(Codec, ResizeToWidthKeepsAspect) {
  ImageBuffer src = ImageBuffer::filled(1600, 900, Color::Colors::White);
  auto out = Codec::resize_to_width(src, 800, Stage::TemplateDecode);
  ASSERT_TRUE(out);
  EXPECT_EQ(out->width, 800u);
  EXPECT_EQ(out->height, 450u);

  auto up = Codec::resize_to_width(
      ImageBuffer::filled(3, 2, Color::Colors::Black), 800,
      Stage::TemplateDecode);
  ASSERT_TRUE(up);
  EXPECT_EQ(up->width, 800u);
  EXPECT_EQ(up->height, 533u);
}

TEST(Codec, OversizedResizeFailsWithCallerStage) {
  ImageBuffer tall = ImageBuffer::filled(1, 4000, Color::Colors::White);
  auto out = Codec::resize_to_width(tall, 8192, Stage::TemplateDecode);
  ASSERT_FALSE(out);
  EXPECT_EQ(out.error().kind, ErrorKind::Decode);
  EXPECT_EQ(out.error().stage, Stage::TemplateDecode);

  auto exact = Codec::resize(tall, 70000, 70000, Stage::PhotoDecode);
  ASSERT_FALSE(exact);
  EXPECT_EQ(exact.error().stage, Stage::PhotoDecode);

  auto logo = Codec::contain_square(tall, 20000, Color::Colors::White,
                                    Stage::LogoDecode);
  ASSERT_FALSE(logo);
  EXPECT_EQ(logo.error().stage, Stage::LogoDecode);
}

TEST(Codec, ContainSquareCentersAndIsOpaque) {
  ImageBuffer wide = ImageBuffer::filled(200, 100, Color::Colors::Black);
  auto contained = Codec::contain_square(
      wide, 50, Color::Colors::FooterBackground, Stage::LogoDecode);
  ASSERT_TRUE(contained);
  const ImageBuffer &logo = *contained;

  ASSERT_EQ(logo.width, 50u);
  ASSERT_EQ(logo.height, 50u);
  EXPECT_EQ(logo.at(25, 0), Color::Colors::FooterBackground);
  EXPECT_EQ(logo.at(25, 49), Color::Colors::FooterBackground);
  EXPECT_EQ(logo.at(25, 25).a, 255);
  EXPECT_LT(logo.at(25, 25).r, 10);
  for (size_t i = 3; i < logo.data.size(); i += 4) {
    ASSERT_EQ(logo.data[i], 255);
  }
}

TEST(Codec, JpegEncodesAndDecodes) {
  ImageBuffer img = Testing::make_test_image(64, 48, Color::Colors::White,
                                             Color::Colors::Divider);
  auto jpeg = Codec::encode_jpeg(img, 80);
  ASSERT_TRUE(jpeg);
  ASSERT_GT(jpeg->size(), 2u);
  EXPECT_EQ((*jpeg)[0], 0xFF);
  EXPECT_EQ((*jpeg)[1], 0xD8);

  auto decoded = Codec::decode_memory(*jpeg, Stage::TemplateDecode);
  ASSERT_TRUE(decoded);
  EXPECT_EQ(decoded->width, 64u);
  EXPECT_EQ(decoded->height, 48u);
}

TEST(Codec, EncodeEmptyImageFails) {
  auto jpeg = Codec::encode_jpeg(ImageBuffer{}, 80);
  ASSERT_FALSE(jpeg);
  EXPECT_EQ(jpeg.error().kind, ErrorKind::EncodeOrWrite);
  EXPECT_EQ(jpeg.error().stage, Stage::Encode);
}

TEST(Codec, DecodeGarbageReportsStage) {
  const std::array<uint8_t, 6> garbage{1, 2, 3, 4, 5, 6};
  auto decoded = Codec::decode_memory(garbage, Stage::LogoDecode);
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().kind, ErrorKind::Decode);
  EXPECT_EQ(decoded.error().stage, Stage::LogoDecode);
}

TEST(Codec, DecodeMissingFile) {
  TempDir dir;
  auto decoded = Codec::decode_file(dir / "missing.png", Stage::TemplateDecode);
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().kind, ErrorKind::Decode);
  EXPECT_EQ(decoded.error().subject, (dir / "missing.png").string());
}

TEST(Codec, WriteFileAtomic) {
  TempDir dir;
  const std::array<uint8_t, 3> bytes{'a', 'b', 'c'};

  auto written = Codec::write_file_atomic(dir / "out.bin", bytes);
  ASSERT_TRUE(written);
  EXPECT_EQ(std::filesystem::file_size(dir / "out.bin"), 3u);
  EXPECT_FALSE(std::filesystem::exists(dir / "out.bin.partial"));
}

TEST(Codec, WriteIntoMissingDirectoryFails) {
  TempDir dir;
  const std::array<uint8_t, 3> bytes{'a', 'b', 'c'};

  auto written =
      Codec::write_file_atomic(dir / "no_such_dir" / "out.bin", bytes);
  ASSERT_FALSE(written);
  EXPECT_EQ(written.error().kind, ErrorKind::EncodeOrWrite);
  EXPECT_EQ(written.error().stage, Stage::Write);
  EXPECT_FALSE(std::filesystem::exists(dir / "no_such_dir"));
}

TEST(PosterError, Describe) {
  PosterError e = PosterError::input("photo", "missing required field: photo");
  const std::string text = e.describe();
  EXPECT_NE(text.find("photo"), std::string::npos);
  EXPECT_NE(text.find(to_string(ErrorKind::InputValidation)),
            std::string::npos);
}
