#include "renderer.h"
#include "../text/font_utils.h"
#include "../text/text_sizing.h"
#include "../utils/logging.h"
#include "include/codec/SkCodec.h"
#include "include/codec/SkJpegDecoder.h"
#include "include/codec/SkPngDecoder.h"
#include "include/core/SkColor.h"
#include "include/core/SkData.h"
#include "include/core/SkFont.h"
#include "include/core/SkFontMetrics.h"
#include "include/core/SkImageInfo.h"
#include "include/core/SkMatrix.h"
#include "include/core/SkPaint.h"
#include "include/core/SkPath.h"
#include "include/core/SkRRect.h"
#include "include/core/SkRect.h"
#include "include/core/SkSamplingOptions.h"
#include "include/core/SkSurface.h"
#include "include/utils/SkParsePath.h"
#include <algorithm>
#include <cmath>
#include <mutex>

namespace {

SkMatrix toSkMatrix(const AffineTransform& t) {
    return SkMatrix::MakeAll(t.scale_x, t.shear_x, t.translate_x,
                             t.shear_y, t.scale_y, t.translate_y,
                             0.0f, 0.0f, 1.0f);
}

SkPaint fillPaint(uint32_t color) {
    SkPaint paint;
    paint.setAntiAlias(true);
    paint.setStyle(SkPaint::kFill_Style);
    paint.setColor(static_cast<SkColor>(color));
    return paint;
}

SkPaint strokePaint(uint32_t color, float width) {
    SkPaint paint;
    paint.setAntiAlias(true);
    paint.setStyle(SkPaint::kStroke_Style);
    paint.setStrokeWidth(width);
    paint.setColor(static_cast<SkColor>(color));
    return paint;
}

std::string describeElement(const VectorElement& element) {
    std::string name = elementKindName(element.kind);
    if (!element.object_id.empty()) {
        name += " '" + element.object_id + "'";
    }
    return name;
}

void drawShape(SkCanvas* canvas, const VectorElement& element, const SkPath* path) {
    SkRect box = SkRect::MakeXYWH(element.x, element.y, element.width, element.height);
    auto draw = [&](const SkPaint& paint) {
        switch (element.kind) {
            case ElementKind::kRect:
                if (element.corner_radius > 0.0f) {
                    canvas->drawRRect(SkRRect::MakeRectXY(box, element.corner_radius, element.corner_radius), paint);
                } else {
                    canvas->drawRect(box, paint);
                }
                break;
            case ElementKind::kEllipse:
                canvas->drawOval(box, paint);
                break;
            case ElementKind::kPath:
                canvas->drawPath(*path, paint);
                break;
            default:
                break;
        }
    };
    if (element.style.has_fill) {
        draw(fillPaint(element.style.fill_color));
    }
    if (element.style.has_stroke && element.style.stroke_width > 0.0f) {
        draw(strokePaint(element.style.stroke_color, element.style.stroke_width));
    }
}

void drawLine(SkCanvas* canvas, const VectorElement& element) {
    uint32_t color = element.style.has_stroke ? element.style.stroke_color
                   : element.style.has_fill ? element.style.fill_color
                   : 0xFF000000;
    canvas->drawLine(element.x, element.y, element.x + element.width, element.y + element.height,
                     strokePaint(color, element.style.stroke_width));
}

void drawText(SkCanvas* canvas, const VectorElement& element) {
    if (element.text.empty()) {
        return;
    }
    const TextStyle& ts = element.text_style;
    sk_sp<SkFontMgr> fontMgr = getFontManager();
    SkFont font(matchTypeface(fontMgr.get(), ts.font_family, ts.font_style), ts.font_size);
    font.setEdging(SkFont::Edging::kAntiAlias);

    if (ts.min_font_size > 0.0f) {
        TextFitConstraint constraint;
        constraint.maxSize = ts.font_size;
        constraint.minSize = ts.min_font_size;
        constraint.boxWidth = element.width;
        constraint.boxHeight = element.height;
        constraint.lineSpacing = ts.line_spacing;
        font.setSize(calculateFitFontSize(font, element.text, constraint));
    }

    SkFontMetrics metrics;
    font.getMetrics(&metrics);
    SkPaint paint = fillPaint(ts.color);
    float baseline = element.y - metrics.fAscent;
    float advance = font.getSize() * ts.line_spacing;

    for (const auto& line : splitTextLines(element.text)) {
        if (!line.empty()) {
            float lineWidth = font.measureText(line.c_str(), line.length(), SkTextEncoding::kUTF8);
            float x = element.x;
            if (ts.align == TextAlign::kCenter) {
                x += (element.width - lineWidth) / 2.0f;
            } else if (ts.align == TextAlign::kEnd) {
                x += element.width - lineWidth;
            }
            canvas->drawSimpleText(line.c_str(), line.length(), SkTextEncoding::kUTF8, x, baseline, font, paint);
        }
        baseline += advance;
    }
}

bool drawImage(SkCanvas* canvas, const VectorElement& element, std::string& error) {
    if (!element.image_data || element.image_data->size() == 0) {
        error = describeElement(element) + ": no image data for '" + element.image_src + "'";
        return false;
    }
    sk_sp<SkImage> image = SkImages::DeferredFromEncodedData(element.image_data);
    // Force the decode so truncated files fail here rather than drawing nothing
    if (image) {
        image = image->makeRasterImage(nullptr);
    }
    if (!image) {
        error = describeElement(element) + ": cannot decode image '" + element.image_src + "'";
        return false;
    }
    float w = element.width > 0.0f ? element.width : static_cast<float>(image->width());
    float h = element.height > 0.0f ? element.height : static_cast<float>(image->height());
    canvas->drawImageRect(image, SkRect::MakeXYWH(element.x, element.y, w, h),
                          SkSamplingOptions(SkFilterMode::kLinear, SkMipmapMode::kNone));
    return true;
}

bool drawElement(SkCanvas* canvas, const VectorElement& element, std::string& error) {
    if (!element.transform.isInvertible()) {
        error = describeElement(element) + ": transform is not invertible";
        return false;
    }

    SkPath path;
    if (element.kind == ElementKind::kPath) {
        if (!SkParsePath::FromSVGString(element.path_data.c_str(), &path)) {
            error = describeElement(element) + ": cannot parse path data";
            return false;
        }
        path.offset(element.x, element.y);
    }

    canvas->save();
    canvas->concat(toSkMatrix(element.transform));
    bool ok = true;
    switch (element.kind) {
        case ElementKind::kRect:
        case ElementKind::kEllipse:
        case ElementKind::kPath:
            drawShape(canvas, element, &path);
            break;
        case ElementKind::kLine:
            drawLine(canvas, element);
            break;
        case ElementKind::kText:
            drawText(canvas, element);
            break;
        case ElementKind::kImage:
            ok = drawImage(canvas, element, error);
            break;
        case ElementKind::kGroup:
            canvas->translate(element.x, element.y);
            for (const auto& child : element.children) {
                if (!drawElement(canvas, child, error)) {
                    ok = false;
                    break;
                }
            }
            break;
    }
    canvas->restore();
    return ok;
}

} // namespace

void registerImageCodecs() {
    static std::once_flag once;
    std::call_once(once, []() {
        SkCodecs::Register(SkPngDecoder::Decoder());
        SkCodecs::Register(SkJpegDecoder::Decoder());
        LOG_DEBUG("Registered image codecs via SkCodecs::Register: png, jpeg");
    });
}

bool drawDocument(SkCanvas* canvas, const VectorDocument& document, std::string& error) {
    if (!(document.width > 0.0f) || !(document.height > 0.0f)) {
        error = "slide has a non-positive intrinsic size";
        return false;
    }
    SkRect content = SkRect::MakeWH(document.width, document.height);
    canvas->save();
    canvas->clipRect(content);
    canvas->drawRect(content, fillPaint(document.background));
    bool ok = true;
    for (const auto& element : document.elements) {
        if (!drawElement(canvas, element, error)) {
            ok = false;
            break;
        }
    }
    canvas->restore();
    return ok;
}

RenderResult renderSlide(const VectorDocument& document, int widthPx, int heightPx, uint32_t fillColor) {
    RenderResult result;
    if (widthPx <= 0 || heightPx <= 0) {
        result.error = "target size " + std::to_string(widthPx) + "x" + std::to_string(heightPx) + " is not positive";
        return result;
    }
    if (!(document.width > 0.0f) || !(document.height > 0.0f)) {
        result.error = "slide has a non-positive intrinsic size";
        return result;
    }
    registerImageCodecs();

    SkImageInfo info = SkImageInfo::MakeN32Premul(widthPx, heightPx);
    sk_sp<SkSurface> surface = SkSurfaces::Raster(info);
    if (!surface) {
        result.error = "failed to create " + std::to_string(widthPx) + "x" + std::to_string(heightPx) + " raster surface";
        return result;
    }
    SkCanvas* canvas = surface->getCanvas();
    canvas->clear(static_cast<SkColor>(fillColor));

    // Fit and center, leaving letterbox/pillarbox bars in the fill color
    float scale = std::min(widthPx / document.width, heightPx / document.height);
    float offsetX = (widthPx - document.width * scale) / 2.0f;
    float offsetY = (heightPx - document.height * scale) / 2.0f;
    canvas->translate(offsetX, offsetY);
    canvas->scale(scale, scale);

    if (!drawDocument(canvas, document, result.error)) {
        return result;
    }

    result.image = surface->makeImageSnapshot();
    if (!result.image) {
        result.error = "failed to snapshot rendered slide";
    }
    return result;
}
