#ifndef VECTOR_DOCUMENT_H
#define VECTOR_DOCUMENT_H

#include "include/core/SkData.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

// Slide vector schema. Sources normalize whatever their API returns into this
// tree; the renderer and transcoders only ever see these types.

enum class ElementKind { kRect, kEllipse, kLine, kPath, kText, kImage, kGroup };
enum class TextAlign { kStart, kCenter, kEnd };

// Row-major 2x3 affine transform, same layout as the Slides API AffineTransform
struct AffineTransform {
    float scale_x = 1.0f;
    float shear_x = 0.0f;
    float translate_x = 0.0f;
    float shear_y = 0.0f;
    float scale_y = 1.0f;
    float translate_y = 0.0f;

    bool isIdentity() const;
    bool isInvertible() const;
};

struct ElementStyle {
    bool has_fill = false;
    uint32_t fill_color = 0xFF000000;    // ARGB
    bool has_stroke = false;
    uint32_t stroke_color = 0xFF000000;
    float stroke_width = 1.0f;
};

struct TextStyle {
    std::string font_family;
    std::string font_style;              // "Regular", "Bold", "Italic", "Bold Italic"
    float font_size = 18.0f;
    float min_font_size = 0.0f;          // > 0 enables shrink-to-fit within the box width
    float line_spacing = 1.2f;
    TextAlign align = TextAlign::kStart;
    uint32_t color = 0xFF000000;
};

struct VectorElement {
    ElementKind kind = ElementKind::kRect;
    std::string object_id;
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
    AffineTransform transform;
    ElementStyle style;
    float corner_radius = 0.0f;          // kRect
    std::string path_data;               // kPath, SVG path syntax in element-local units
    std::string text;                    // kText
    TextStyle text_style;                // kText
    std::string image_src;               // kImage, as referenced by the source
    sk_sp<SkData> image_data;            // kImage, encoded bytes resolved at ingress
    std::vector<VectorElement> children; // kGroup
};

struct VectorDocument {
    std::string slide_id;
    float width = 0.0f;                  // intrinsic size in points
    float height = 0.0f;
    uint32_t background = 0xFFFFFFFF;
    std::vector<VectorElement> elements;
};

// Resolves an image reference to encoded bytes; returns nullptr if unavailable
using ImageResolver = std::function<sk_sp<SkData>(const std::string& src)>;

struct DocumentParseResult {
    VectorDocument document;
    std::string error;

    bool success() const { return error.empty(); }
};

// Validate and normalize a JSON slide description
DocumentParseResult parseVectorDocument(const nlohmann::json& json, const ImageResolver& resolveImage);

// Normalized description of the document for metadata dumps (image bytes omitted)
nlohmann::json documentToJson(const VectorDocument& document);

// "#RRGGBB" or "#AARRGGBB" -> ARGB. Returns false on malformed input
bool parseColor(const std::string& text, uint32_t& argb);

// ARGB -> "#AARRGGBB"
std::string formatColor(uint32_t argb);

const char* elementKindName(ElementKind kind);

#endif // VECTOR_DOCUMENT_H
