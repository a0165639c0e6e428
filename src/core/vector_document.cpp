#include "vector_document.h"
#include "../utils/string_utils.h"
#include <cmath>
#include <cstdio>

namespace {

constexpr int kMaxGroupDepth = 32;

float readFloat(const nlohmann::json& j, const char* key, float fallback) {
    if (j.contains(key) && j[key].is_number()) {
        return j[key].get<float>();
    }
    return fallback;
}

std::string readString(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return "";
}

bool readColor(const nlohmann::json& j, const char* key, uint32_t& out, std::string& error) {
    if (!j.contains(key) || j[key].is_null()) {
        return false;
    }
    if (!j[key].is_string() || !parseColor(j[key].get<std::string>(), out)) {
        error = std::string("invalid color in '") + key + "'";
        return false;
    }
    return true;
}

bool parseKind(const std::string& type, ElementKind& kind) {
    if (type == "rect") kind = ElementKind::kRect;
    else if (type == "ellipse") kind = ElementKind::kEllipse;
    else if (type == "line") kind = ElementKind::kLine;
    else if (type == "path") kind = ElementKind::kPath;
    else if (type == "text") kind = ElementKind::kText;
    else if (type == "image") kind = ElementKind::kImage;
    else if (type == "group") kind = ElementKind::kGroup;
    else return false;
    return true;
}

TextAlign parseAlign(const std::string& align) {
    std::string lowered = toLowerCopy(align);
    if (lowered == "center") return TextAlign::kCenter;
    if (lowered == "end" || lowered == "right") return TextAlign::kEnd;
    return TextAlign::kStart;
}

const char* alignName(TextAlign align) {
    switch (align) {
        case TextAlign::kCenter: return "center";
        case TextAlign::kEnd:    return "end";
        case TextAlign::kStart:  break;
    }
    return "start";
}

bool parseElement(const nlohmann::json& j, const ImageResolver& resolveImage, int depth,
                  VectorElement& element, std::string& error) {
    if (!j.is_object()) {
        error = "element is not an object";
        return false;
    }
    if (depth > kMaxGroupDepth) {
        error = "groups nested deeper than " + std::to_string(kMaxGroupDepth);
        return false;
    }

    std::string type = readString(j, "type");
    if (!parseKind(type, element.kind)) {
        error = "unknown element type '" + type + "'";
        return false;
    }
    element.object_id = readString(j, "id");
    element.x = readFloat(j, "x", 0.0f);
    element.y = readFloat(j, "y", 0.0f);
    element.width = readFloat(j, "width", 0.0f);
    element.height = readFloat(j, "height", 0.0f);

    if (j.contains("transform") && j["transform"].is_object()) {
        const auto& t = j["transform"];
        element.transform.scale_x = readFloat(t, "scaleX", 1.0f);
        element.transform.scale_y = readFloat(t, "scaleY", 1.0f);
        element.transform.shear_x = readFloat(t, "shearX", 0.0f);
        element.transform.shear_y = readFloat(t, "shearY", 0.0f);
        element.transform.translate_x = readFloat(t, "translateX", 0.0f);
        element.transform.translate_y = readFloat(t, "translateY", 0.0f);
    }

    element.style.has_fill = readColor(j, "fill", element.style.fill_color, error);
    if (!error.empty()) return false;
    element.style.has_stroke = readColor(j, "stroke", element.style.stroke_color, error);
    if (!error.empty()) return false;
    element.style.stroke_width = readFloat(j, "strokeWidth", 1.0f);

    const std::string where = element.object_id.empty() ? type : element.object_id;

    switch (element.kind) {
        case ElementKind::kRect:
            element.corner_radius = readFloat(j, "cornerRadius", 0.0f);
            break;
        case ElementKind::kEllipse:
        case ElementKind::kLine:
            break;
        case ElementKind::kPath:
            element.path_data = readString(j, "d");
            if (element.path_data.empty()) {
                error = "path '" + where + "' has no 'd' data";
                return false;
            }
            break;
        case ElementKind::kText: {
            element.text = readString(j, "text");
            // Slides use vertical tab for soft line breaks
            replaceAllInPlace(element.text, "\r\n", "\n");
            replaceCharInPlace(element.text, '\v', '\n');
            replaceCharInPlace(element.text, '\r', '\n');
            TextStyle& ts = element.text_style;
            ts.font_family = readString(j, "fontFamily");
            ts.font_style = readString(j, "fontStyle");
            ts.font_size = readFloat(j, "fontSize", ts.font_size);
            ts.min_font_size = readFloat(j, "minFontSize", 0.0f);
            ts.line_spacing = readFloat(j, "lineSpacing", ts.line_spacing);
            ts.align = parseAlign(readString(j, "align"));
            readColor(j, "color", ts.color, error);
            if (!error.empty()) return false;
            if (ts.font_size <= 0.0f) {
                error = "text '" + where + "' has non-positive fontSize";
                return false;
            }
            break;
        }
        case ElementKind::kImage:
            element.image_src = readString(j, "src");
            if (element.image_src.empty()) {
                error = "image '" + where + "' has no 'src'";
                return false;
            }
            if (resolveImage) {
                element.image_data = resolveImage(element.image_src);
            }
            break;
        case ElementKind::kGroup:
            if (j.contains("children")) {
                if (!j["children"].is_array()) {
                    error = "group '" + where + "' children is not an array";
                    return false;
                }
                for (const auto& child : j["children"]) {
                    VectorElement childElement;
                    if (!parseElement(child, resolveImage, depth + 1, childElement, error)) {
                        return false;
                    }
                    element.children.push_back(std::move(childElement));
                }
            }
            break;
    }
    return true;
}

nlohmann::json elementToJson(const VectorElement& element) {
    nlohmann::json j;
    j["type"] = elementKindName(element.kind);
    if (!element.object_id.empty()) j["id"] = element.object_id;
    j["x"] = element.x;
    j["y"] = element.y;
    j["width"] = element.width;
    j["height"] = element.height;
    if (!element.transform.isIdentity()) {
        const auto& t = element.transform;
        j["transform"] = {
            {"scaleX", t.scale_x}, {"scaleY", t.scale_y},
            {"shearX", t.shear_x}, {"shearY", t.shear_y},
            {"translateX", t.translate_x}, {"translateY", t.translate_y},
        };
    }
    if (element.style.has_fill) j["fill"] = formatColor(element.style.fill_color);
    if (element.style.has_stroke) {
        j["stroke"] = formatColor(element.style.stroke_color);
        j["strokeWidth"] = element.style.stroke_width;
    }
    switch (element.kind) {
        case ElementKind::kRect:
            if (element.corner_radius > 0.0f) j["cornerRadius"] = element.corner_radius;
            break;
        case ElementKind::kPath:
            j["d"] = element.path_data;
            break;
        case ElementKind::kText:
            j["text"] = element.text;
            j["fontFamily"] = element.text_style.font_family;
            j["fontStyle"] = element.text_style.font_style;
            j["fontSize"] = element.text_style.font_size;
            if (element.text_style.min_font_size > 0.0f) j["minFontSize"] = element.text_style.min_font_size;
            j["align"] = alignName(element.text_style.align);
            j["color"] = formatColor(element.text_style.color);
            break;
        case ElementKind::kImage:
            j["src"] = element.image_src;
            j["bytes"] = element.image_data ? element.image_data->size() : 0;
            break;
        case ElementKind::kGroup: {
            nlohmann::json children = nlohmann::json::array();
            for (const auto& child : element.children) {
                children.push_back(elementToJson(child));
            }
            j["children"] = std::move(children);
            break;
        }
        case ElementKind::kEllipse:
        case ElementKind::kLine:
            break;
    }
    return j;
}

} // namespace

bool AffineTransform::isIdentity() const {
    return scale_x == 1.0f && scale_y == 1.0f && shear_x == 0.0f && shear_y == 0.0f &&
           translate_x == 0.0f && translate_y == 0.0f;
}

bool AffineTransform::isInvertible() const {
    float det = scale_x * scale_y - shear_x * shear_y;
    return std::isfinite(det) && std::fabs(det) > 1e-12f;
}

DocumentParseResult parseVectorDocument(const nlohmann::json& json, const ImageResolver& resolveImage) {
    DocumentParseResult result;
    if (!json.is_object()) {
        result.error = "slide document is not a JSON object";
        return result;
    }

    VectorDocument& doc = result.document;
    doc.slide_id = readString(json, "id");
    doc.width = readFloat(json, "width", 0.0f);
    doc.height = readFloat(json, "height", 0.0f);
    if (!(doc.width > 0.0f) || !(doc.height > 0.0f)) {
        result.error = "slide document needs positive 'width' and 'height'";
        return result;
    }
    readColor(json, "background", doc.background, result.error);
    if (!result.error.empty()) {
        return result;
    }

    if (json.contains("elements")) {
        if (!json["elements"].is_array()) {
            result.error = "'elements' is not an array";
            return result;
        }
        for (const auto& item : json["elements"]) {
            VectorElement element;
            if (!parseElement(item, resolveImage, 0, element, result.error)) {
                return result;
            }
            doc.elements.push_back(std::move(element));
        }
    }
    return result;
}

nlohmann::json documentToJson(const VectorDocument& document) {
    nlohmann::json j;
    j["id"] = document.slide_id;
    j["width"] = document.width;
    j["height"] = document.height;
    j["background"] = formatColor(document.background);
    nlohmann::json elements = nlohmann::json::array();
    for (const auto& element : document.elements) {
        elements.push_back(elementToJson(element));
    }
    j["elements"] = std::move(elements);
    return j;
}

bool parseColor(const std::string& text, uint32_t& argb) {
    std::string s = trimCopy(text);
    if (s.empty() || s[0] != '#') {
        return false;
    }
    s.erase(0, 1);
    if (s.size() != 6 && s.size() != 8) {
        return false;
    }
    uint32_t value = 0;
    for (char c : s) {
        value <<= 4;
        if (c >= '0' && c <= '9') value |= static_cast<uint32_t>(c - '0');
        else if (c >= 'a' && c <= 'f') value |= static_cast<uint32_t>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') value |= static_cast<uint32_t>(c - 'A' + 10);
        else return false;
    }
    argb = (s.size() == 6) ? (0xFF000000u | value) : value;
    return true;
}

std::string formatColor(uint32_t argb) {
    char buf[10];
    snprintf(buf, sizeof(buf), "#%08X", argb);
    return buf;
}

const char* elementKindName(ElementKind kind) {
    switch (kind) {
        case ElementKind::kRect:    return "rect";
        case ElementKind::kEllipse: return "ellipse";
        case ElementKind::kLine:    return "line";
        case ElementKind::kPath:    return "path";
        case ElementKind::kText:    return "text";
        case ElementKind::kImage:   return "image";
        case ElementKind::kGroup:   return "group";
    }
    return "unknown";
}
