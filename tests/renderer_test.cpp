#include <gtest/gtest.h>
#include "test_support.h"
#include "core/export_request.h"
#include "core/frame_encoder.h"
#include "core/renderer.h"
#include "include/core/SkBitmap.h"
#include "include/core/SkColor.h"

namespace {

SkColor pixelAt(const sk_sp<SkImage>& image, int x, int y) {
    SkBitmap bitmap;
    bitmap.allocPixels(SkImageInfo::MakeN32Premul(image->width(), image->height()));
    EXPECT_TRUE(image->readPixels(nullptr, bitmap.pixmap(), 0, 0));
    return bitmap.getColor(x, y);
}

VectorDocument plainSlide(float width, float height, uint32_t background) {
    VectorDocument doc;
    doc.slide_id = "plain";
    doc.width = width;
    doc.height = height;
    doc.background = background;
    return doc;
}

} // namespace

TEST(RendererTest, RendersAtRequestedSize) {
    RenderResult result = renderSlide(makeSlide("s1"), 320, 180, 0xFF000000);
    ASSERT_TRUE(result.success()) << result.error;
    ASSERT_EQ(result.image->width(), 320);
    ASSERT_EQ(result.image->height(), 180);
    // Background corner and the centered rectangle
    ASSERT_EQ(pixelAt(result.image, 2, 2), SK_ColorWHITE);
    ASSERT_EQ(pixelAt(result.image, 160, 90), SkColorSetARGB(0xFF, 0x20, 0x60, 0xC0));
}

TEST(RendererTest, PillarboxUsesFillColor) {
    // Square slide into a 2:1 target leaves 50px bars on each side
    RenderResult result = renderSlide(plainSlide(100, 100, 0xFFFFFFFF), 200, 100, 0xFFFF0000);
    ASSERT_TRUE(result.success()) << result.error;
    ASSERT_EQ(pixelAt(result.image, 10, 50), SK_ColorRED);
    ASSERT_EQ(pixelAt(result.image, 190, 50), SK_ColorRED);
    ASSERT_EQ(pixelAt(result.image, 100, 50), SK_ColorWHITE);
}

TEST(RendererTest, LetterboxUsesFillColor) {
    RenderResult result = renderSlide(plainSlide(200, 100, 0xFF00FF00), 200, 200, 0xFF0000FF);
    ASSERT_TRUE(result.success()) << result.error;
    ASSERT_EQ(pixelAt(result.image, 100, 10), SK_ColorBLUE);
    ASSERT_EQ(pixelAt(result.image, 100, 100), SK_ColorGREEN);
    ASSERT_EQ(pixelAt(result.image, 100, 190), SK_ColorBLUE);
}

TEST(RendererTest, RejectsBadSizes) {
    ASSERT_FALSE(renderSlide(makeSlide("s1"), 0, 100, 0xFF000000).success());
    ASSERT_FALSE(renderSlide(plainSlide(0, 100, 0xFFFFFFFF), 100, 100, 0xFF000000).success());
}

TEST(RendererTest, NonInvertibleTransformIsAnError) {
    VectorDocument doc = makeSlide("s1");
    doc.elements[0].transform.scale_x = 0.0f;
    doc.elements[0].transform.shear_x = 0.0f;
    RenderResult result = renderSlide(doc, 100, 100, 0xFF000000);
    ASSERT_FALSE(result.success());
    ASSERT_NE(result.error.find("not invertible"), std::string::npos);
}

TEST(RendererTest, UndecodableImageIsAnError) {
    VectorDocument doc = plainSlide(100, 100, 0xFFFFFFFF);
    VectorElement image;
    image.kind = ElementKind::kImage;
    image.image_src = "broken.png";
    image.image_data = SkData::MakeWithCopy("not an image", 12);
    image.width = 10;
    image.height = 10;
    doc.elements.push_back(image);
    ASSERT_FALSE(renderSlide(doc, 100, 100, 0xFF000000).success());

    doc.elements[0].image_data = nullptr;
    ASSERT_FALSE(renderSlide(doc, 100, 100, 0xFF000000).success());
}

TEST(RendererTest, DrawsEmbeddedImages) {
    RenderResult red = renderSlide(plainSlide(8, 8, 0xFFFF0000), 8, 8, 0xFF000000);
    ASSERT_TRUE(red.success());
    EncodedArtifact png = encodeRaster(red.image, ExportFormat::kPng, RenderOptions());
    ASSERT_TRUE(png.success()) << png.error;

    VectorDocument doc = plainSlide(100, 100, 0xFFFFFFFF);
    VectorElement image;
    image.kind = ElementKind::kImage;
    image.image_src = "red.png";
    image.image_data = png.data;
    image.x = 0;
    image.y = 0;
    image.width = 50;
    image.height = 50;
    doc.elements.push_back(image);

    RenderResult result = renderSlide(doc, 100, 100, 0xFF000000);
    ASSERT_TRUE(result.success()) << result.error;
    ASSERT_EQ(pixelAt(result.image, 25, 25), SK_ColorRED);
    ASSERT_EQ(pixelAt(result.image, 75, 75), SK_ColorWHITE);
}

TEST(RendererTest, TextAndPathsDraw) {
    VectorDocument doc = plainSlide(200, 100, 0xFFFFFFFF);
    VectorElement text;
    text.kind = ElementKind::kText;
    text.text = "Hello\nWorld";
    text.width = 200;
    text.height = 100;
    text.text_style.font_size = 40.0f;
    text.text_style.min_font_size = 8.0f;
    doc.elements.push_back(text);

    VectorElement path;
    path.kind = ElementKind::kPath;
    path.path_data = "M0 0 L20 0 L20 20 Z";
    path.style.has_fill = true;
    path.style.fill_color = 0xFF000000;
    doc.elements.push_back(path);

    RenderResult result = renderSlide(doc, 200, 100, 0xFF000000);
    ASSERT_TRUE(result.success()) << result.error;

    doc.elements[1].path_data = "M0 0 X 5";
    ASSERT_FALSE(renderSlide(doc, 200, 100, 0xFF000000).success());
}
