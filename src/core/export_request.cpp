#include "export_request.h"
#include "export_result.h"
#include "../utils/string_utils.h"
#include <cmath>

const char* namingSchemeName(NamingScheme scheme) {
    return scheme == NamingScheme::kNamed ? "named" : "index";
}

NamingScheme parseNamingScheme(const std::string& value) {
    std::string lowered = toLowerCopy(trimCopy(value));
    if (lowered == "index") return NamingScheme::kIndex;
    if (lowered == "named") return NamingScheme::kNamed;
    throw InvalidRequestError("unknown naming scheme: '" + value + "' (expected index or named)");
}

// Finite, positive and short enough that duration * fps frames fit in an int
static void checkDuration(double seconds, double fps, const std::string& what) {
    if (!std::isfinite(seconds) || !(seconds > 0.0)) {
        throw InvalidRequestError(what + " must be a positive finite number of seconds");
    }
    if (seconds * fps > kMaxFramesPerSlide) {
        throw InvalidRequestError(what + " of " + std::to_string(seconds) + "s at " + std::to_string(fps) +
                                  " fps needs more frames than a video can hold");
    }
}

void validateRenderOptions(const RenderOptions& options) {
    if (!(options.fps > 0.0) || !std::isfinite(options.fps)) {
        throw InvalidRequestError("fps must be positive");
    }
    if (options.width < 0 || options.height < 0 || options.video_width < 0 || options.video_height < 0) {
        throw InvalidRequestError("sizes must not be negative");
    }
    if ((options.width == 0) != (options.height == 0)) {
        throw InvalidRequestError("width and height must be given together");
    }
    if ((options.video_width == 0) != (options.video_height == 0)) {
        throw InvalidRequestError("video width and height must be given together");
    }
    if (options.dpi < 0.0f) {
        throw InvalidRequestError("dpi must not be negative");
    }
    if (options.width == 0 && options.dpi <= 0.0f) {
        throw InvalidRequestError("either a resolution or a dpi is required");
    }
    if (options.jpeg_quality < 1 || options.jpeg_quality > 100) {
        throw InvalidRequestError("jpeg quality must be within 1..100");
    }
    checkDuration(options.slide_duration_secs, options.fps, "slide duration");
    if (!std::isfinite(options.total_video_duration_secs) || options.total_video_duration_secs < 0.0) {
        throw InvalidRequestError("total video duration must be finite and not negative");
    }
    if (options.total_video_duration_secs > 0.0) {
        checkDuration(options.total_video_duration_secs, options.fps, "total video duration");
    }
    if (trimCopy(options.video_codec).empty()) {
        throw InvalidRequestError("video codec must not be empty");
    }
    for (const auto& [key, value] : options.codec_options) {
        if (trimCopy(key).empty()) {
            throw InvalidRequestError("codec option with empty key (value '" + value + "')");
        }
    }
}

void validateRequest(const ExportRequest& request) {
    validateRenderOptions(request.options);
    if (request.formats.empty()) {
        throw InvalidRequestError("no export formats requested");
    }
    normalizeFormats(request.formats);

    const Presentation& p = request.presentation;
    if (trimCopy(p.id()).empty()) {
        throw InvalidRequestError("presentation id is empty");
    }
    if (p.isExplicit() && p.slides().empty()) {
        throw InvalidRequestError("explicit presentation '" + p.id() + "' has no slides");
    }
    for (const auto& slide : p.slides()) {
        if (slide.presentation_id.empty() || slide.slide_id.empty()) {
            throw InvalidRequestError("presentation '" + p.id() + "' has a slide reference with an empty id");
        }
        if (slide.duration_secs) {
            checkDuration(*slide.duration_secs, request.options.fps, "duration of slide '" + slide.slide_id + "'");
        }
    }
    if (request.output_root.empty()) {
        throw InvalidRequestError("output root is empty");
    }
}

std::vector<double> effectiveDurations(const Presentation& presentation, const RenderOptions& options) {
    const auto& slides = presentation.slides();
    double fallback = options.slide_duration_secs;
    if (options.total_video_duration_secs > 0.0 && !slides.empty()) {
        fallback = options.total_video_duration_secs / static_cast<double>(slides.size());
    }

    std::vector<double> durations;
    durations.reserve(slides.size());
    for (const auto& slide : slides) {
        durations.push_back(slide.duration_secs ? *slide.duration_secs : fallback);
    }
    return durations;
}

PixelSize stillSize(const RenderOptions& options, float intrinsicWidth, float intrinsicHeight) {
    if (options.width > 0 && options.height > 0) {
        return {options.width, options.height};
    }
    // Intrinsic sizes are in points (1/72 inch)
    float scale = options.dpi / 72.0f;
    return {
        static_cast<int>(std::lround(intrinsicWidth * scale)),
        static_cast<int>(std::lround(intrinsicHeight * scale)),
    };
}

PixelSize videoSize(const RenderOptions& options, float intrinsicWidth, float intrinsicHeight) {
    if (options.video_width > 0 && options.video_height > 0) {
        return {options.video_width, options.video_height};
    }
    PixelSize size = stillSize(options, intrinsicWidth, intrinsicHeight);
    if (options.width > 0 && options.height > 0) {
        return size;
    }
    size.width &= ~1;
    size.height &= ~1;
    return size;
}
