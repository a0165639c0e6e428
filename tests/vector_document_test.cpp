#include <gtest/gtest.h>
#include "core/vector_document.h"

using json = nlohmann::json;

TEST(VectorDocumentTest, ParsesElementsAndDefaults) {
    json j = json::parse(R"({
        "id": "s1",
        "width": 960, "height": 540,
        "background": "#336699",
        "elements": [
            {"type": "rect", "id": "box", "x": 10, "y": 20, "width": 100, "height": 50,
             "fill": "#80FF0000", "cornerRadius": 4},
            {"type": "text", "text": "Title\u000bSubtitle\r\nEnd", "fontSize": 32, "align": "Center",
             "transform": {"scaleX": 2, "translateX": 5}},
            {"type": "group", "x": 5, "children": [
                {"type": "ellipse", "width": 10, "height": 10, "stroke": "#000000", "strokeWidth": 2},
                {"type": "path", "d": "M0 0 L10 10"}
            ]}
        ]
    })");
    DocumentParseResult parsed = parseVectorDocument(j, nullptr);
    ASSERT_TRUE(parsed.success()) << parsed.error;
    const VectorDocument& doc = parsed.document;
    ASSERT_EQ(doc.slide_id, "s1");
    ASSERT_FLOAT_EQ(doc.width, 960.0f);
    ASSERT_EQ(doc.background, 0xFF336699u);
    ASSERT_EQ(doc.elements.size(), 3u);

    const VectorElement& rect = doc.elements[0];
    ASSERT_EQ(rect.kind, ElementKind::kRect);
    ASSERT_EQ(rect.object_id, "box");
    ASSERT_TRUE(rect.style.has_fill);
    ASSERT_EQ(rect.style.fill_color, 0x80FF0000u);
    ASSERT_FALSE(rect.style.has_stroke);
    ASSERT_FLOAT_EQ(rect.corner_radius, 4.0f);

    const VectorElement& text = doc.elements[1];
    ASSERT_EQ(text.text, "Title\nSubtitle\nEnd");
    ASSERT_EQ(text.text_style.align, TextAlign::kCenter);
    ASSERT_FLOAT_EQ(text.transform.scale_x, 2.0f);
    ASSERT_FLOAT_EQ(text.transform.translate_x, 5.0f);
    ASSERT_FALSE(text.transform.isIdentity());

    const VectorElement& group = doc.elements[2];
    ASSERT_EQ(group.children.size(), 2u);
    ASSERT_EQ(group.children[0].kind, ElementKind::kEllipse);
    ASSERT_FLOAT_EQ(group.children[0].style.stroke_width, 2.0f);
    ASSERT_EQ(group.children[1].path_data, "M0 0 L10 10");
}

TEST(VectorDocumentTest, ReportsMalformedInput) {
    auto errorOf = [](const char* text) {
        return parseVectorDocument(json::parse(text), nullptr).error;
    };
    ASSERT_FALSE(errorOf(R"([1, 2])").empty());
    ASSERT_FALSE(errorOf(R"({"width": 0, "height": 540})").empty());
    ASSERT_FALSE(errorOf(R"({"width": 960, "height": 540, "background": "blue"})").empty());
    ASSERT_FALSE(errorOf(R"({"width": 960, "height": 540, "elements": {}})").empty());
    ASSERT_FALSE(errorOf(R"({"width": 960, "height": 540, "elements": [{"type": "star"}]})").empty());
    ASSERT_FALSE(errorOf(R"({"width": 960, "height": 540, "elements": [{"type": "path"}]})").empty());
    ASSERT_FALSE(errorOf(R"({"width": 960, "height": 540, "elements": [{"type": "image"}]})").empty());
    ASSERT_FALSE(errorOf(R"({"width": 960, "height": 540, "elements": [{"type": "text", "fontSize": 0}]})").empty());
    ASSERT_FALSE(errorOf(R"({"width": 960, "height": 540, "elements": [{"type": "rect", "fill": "#12"}]})").empty());
}

TEST(VectorDocumentTest, ResolvesImagesThroughResolver) {
    json j = json::parse(R"({"width": 100, "height": 100,
        "elements": [{"type": "image", "src": "img/logo.png", "width": 10, "height": 10}]})");
    std::string requested;
    DocumentParseResult parsed = parseVectorDocument(j, [&requested](const std::string& src) {
        requested = src;
        return SkData::MakeWithCopy("abc", 3);
    });
    ASSERT_TRUE(parsed.success()) << parsed.error;
    ASSERT_EQ(requested, "img/logo.png");
    ASSERT_NE(parsed.document.elements[0].image_data, nullptr);
    ASSERT_EQ(parsed.document.elements[0].image_data->size(), 3u);
}

TEST(VectorDocumentTest, RejectsDeeplyNestedGroups) {
    json element = {{"type", "rect"}};
    for (int i = 0; i < 40; ++i) {
        element = {{"type", "group"}, {"children", json::array({element})}};
    }
    json j = {{"width", 10}, {"height", 10}, {"elements", json::array({element})}};
    ASSERT_FALSE(parseVectorDocument(j, nullptr).success());
}

TEST(VectorDocumentTest, Colors) {
    uint32_t argb = 0;
    ASSERT_TRUE(parseColor("#ff8800", argb));
    ASSERT_EQ(argb, 0xFFFF8800u);
    ASSERT_TRUE(parseColor("#00000000", argb));
    ASSERT_EQ(argb, 0u);
    ASSERT_FALSE(parseColor("ff8800", argb));
    ASSERT_FALSE(parseColor("#ggg000", argb));
    ASSERT_EQ(formatColor(0xFF336699), "#FF336699");
}

TEST(VectorDocumentTest, TransformInvertibility) {
    AffineTransform t;
    ASSERT_TRUE(t.isIdentity());
    ASSERT_TRUE(t.isInvertible());
    t.scale_x = 0.0f;
    ASSERT_FALSE(t.isInvertible());
}

TEST(VectorDocumentTest, DocumentToJsonOmitsImageBytes) {
    VectorDocument doc;
    doc.slide_id = "s1";
    doc.width = 10;
    doc.height = 10;
    VectorElement image;
    image.kind = ElementKind::kImage;
    image.image_src = "a.png";
    image.image_data = SkData::MakeWithCopy("abcd", 4);
    doc.elements.push_back(image);

    json j = documentToJson(doc);
    ASSERT_EQ(j["id"], "s1");
    ASSERT_EQ(j["elements"][0]["type"], "image");
    ASSERT_EQ(j["elements"][0]["src"], "a.png");
    ASSERT_EQ(j["elements"][0]["bytes"], 4);
}
