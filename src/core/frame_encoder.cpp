#include "frame_encoder.h"
#include "renderer.h"
#include "../utils/logging.h"
#include "../utils/version.h"
#include "include/core/SkCanvas.h"
#include "include/core/SkRect.h"
#include "include/core/SkStream.h"
#include "include/encode/SkJpegEncoder.h"
#include "include/encode/SkPngEncoder.h"
#include "include/svg/SkSVGCanvas.h"
#include <memory>

EncodedArtifact encodeRaster(const sk_sp<SkImage>& image, ExportFormat format, const RenderOptions& options) {
    EncodedArtifact result;
    if (!image) {
        result.error = "no image to encode";
        return result;
    }

    if (format == ExportFormat::kPng) {
        SkPngEncoder::Options png_options;
        png_options.fZLibLevel = 1;  // Faster compression
        result.data = SkPngEncoder::Encode(nullptr, image.get(), png_options);
    } else if (format == ExportFormat::kJpeg) {
        SkJpegEncoder::Options jpeg_options;
        jpeg_options.fQuality = options.jpeg_quality;
        jpeg_options.fAlphaOption = SkJpegEncoder::AlphaOption::kBlendOnBlack;
        result.data = SkJpegEncoder::Encode(nullptr, image.get(), jpeg_options);
    } else {
        result.error_kind = ErrorKind::kUnsupportedFormat;
        result.error = std::string("raster encoder cannot produce ") + formatName(format);
        return result;
    }

    if (!result.data) {
        result.error = std::string("failed to encode ") + formatName(format);
    }
    return result;
}

EncodedArtifact encodeSvg(const VectorDocument& document) {
    EncodedArtifact result;
    if (!(document.width > 0.0f) || !(document.height > 0.0f)) {
        result.error = "slide has a non-positive intrinsic size";
        return result;
    }
    registerImageCodecs();

    SkDynamicMemoryWStream stream;
    {
        std::unique_ptr<SkCanvas> canvas = SkSVGCanvas::Make(SkRect::MakeWH(document.width, document.height), &stream);
        if (!canvas) {
            result.error = "failed to create SVG canvas";
            return result;
        }
        if (!drawDocument(canvas.get(), document, result.error)) {
            return result;
        }
        // The closing tag is written when the canvas is destroyed
    }
    result.data = stream.detachAsData();
    if (!result.data || result.data->size() == 0) {
        result.data = nullptr;
        result.error = "SVG canvas produced no output";
    }
    return result;
}

EncodedArtifact encodeMetadata(const Presentation& presentation, const std::vector<Slide>& slides) {
    EncodedArtifact result;

    nlohmann::json slideList = nlohmann::json::array();
    for (const auto& slide : slides) {
        slideList.push_back({
            {"index", slide.index},
            {"presentation_id", slide.ref.presentation_id},
            {"slide_id", slide.ref.slide_id},
            {"duration_secs", slide.duration_secs},
            {"document", documentToJson(slide.document)},
        });
    }

    nlohmann::json root = {
        {"presentation", {
            {"id", presentation.id()},
            {"name", presentation.displayName()},
            {"kind", presentationKindName(presentation.kind())},
            {"parent_path", presentation.parentPath()},
        }},
        {"metadata", presentation.metadata()},
        {"slides", slideList},
        {"generator", std::string("slidecast ") + getSlidecastVersion()},
    };

    try {
        std::string text = root.dump(2);
        text.push_back('\n');
        result.data = SkData::MakeWithCopy(text.data(), text.size());
    } catch (const nlohmann::json::exception& e) {
        // dump() throws on invalid UTF-8 coming from remote metadata
        result.error = std::string("failed to serialize metadata: ") + e.what();
    }
    return result;
}
