#include <gtest/gtest.h>
#include "test_support.h"
#include "core/frame_encoder.h"
#include "core/renderer.h"
#include <cstring>

namespace {

std::string bytesOf(const sk_sp<SkData>& data) {
    return std::string(static_cast<const char*>(data->data()), data->size());
}

sk_sp<SkImage> renderedSlide() {
    RenderResult result = renderSlide(makeSlide("s1"), 64, 36, 0xFF000000);
    EXPECT_TRUE(result.success()) << result.error;
    return result.image;
}

} // namespace

TEST(FrameEncoderTest, PngSignature) {
    EncodedArtifact png = encodeRaster(renderedSlide(), ExportFormat::kPng, RenderOptions());
    ASSERT_TRUE(png.success()) << png.error;
    ASSERT_GE(png.data->size(), 8u);
    ASSERT_EQ(std::memcmp(png.data->data(), "\x89PNG\r\n\x1a\n", 8), 0);
}

TEST(FrameEncoderTest, JpegSignatureAndQuality) {
    RenderOptions high;
    high.jpeg_quality = 100;
    RenderOptions low;
    low.jpeg_quality = 5;
    sk_sp<SkImage> image = renderedSlide();
    EncodedArtifact best = encodeRaster(image, ExportFormat::kJpeg, high);
    EncodedArtifact worst = encodeRaster(image, ExportFormat::kJpeg, low);
    ASSERT_TRUE(best.success()) << best.error;
    ASSERT_TRUE(worst.success()) << worst.error;
    const auto* bytes = static_cast<const uint8_t*>(best.data->data());
    ASSERT_EQ(bytes[0], 0xFF);
    ASSERT_EQ(bytes[1], 0xD8);
    ASSERT_GT(best.data->size(), worst.data->size());
}

TEST(FrameEncoderTest, UnsupportedRasterFormat) {
    EncodedArtifact result = encodeRaster(renderedSlide(), ExportFormat::kMp4, RenderOptions());
    ASSERT_FALSE(result.success());
    ASSERT_EQ(result.error_kind, ErrorKind::kUnsupportedFormat);

    EncodedArtifact empty = encodeRaster(nullptr, ExportFormat::kPng, RenderOptions());
    ASSERT_FALSE(empty.success());
}

TEST(FrameEncoderTest, SvgDocument) {
    EncodedArtifact svg = encodeSvg(makeSlide("s1"));
    ASSERT_TRUE(svg.success()) << svg.error;
    std::string text = bytesOf(svg.data);
    ASSERT_NE(text.find("<svg"), std::string::npos);
    ASSERT_NE(text.find("</svg>"), std::string::npos);

    VectorDocument empty;
    ASSERT_FALSE(encodeSvg(empty).success());
}

TEST(FrameEncoderTest, MetadataSidecar) {
    Presentation p = Presentation::sourced("P1", "Quarterly", {"Team"}, {{"P1", "s1", {}}},
                                           nlohmann::json{{"locale", "en"}});
    Slide slide;
    slide.index = 0;
    slide.ref = p.slides()[0];
    slide.duration_secs = 3.0;
    slide.document = makeSlide("s1");

    EncodedArtifact json = encodeMetadata(p, {slide});
    ASSERT_TRUE(json.success()) << json.error;
    nlohmann::json parsed = nlohmann::json::parse(bytesOf(json.data));
    ASSERT_EQ(parsed["presentation"]["id"], "P1");
    ASSERT_EQ(parsed["presentation"]["name"], "Quarterly");
    ASSERT_EQ(parsed["presentation"]["kind"], "sourced");
    ASSERT_EQ(parsed["presentation"]["parent_path"][0], "Team");
    ASSERT_EQ(parsed["metadata"]["locale"], "en");
    ASSERT_EQ(parsed["slides"].size(), 1u);
    ASSERT_EQ(parsed["slides"][0]["slide_id"], "s1");
    ASSERT_DOUBLE_EQ(parsed["slides"][0]["duration_secs"].get<double>(), 3.0);
    ASSERT_EQ(parsed["slides"][0]["document"]["elements"].size(), 1u);
}
