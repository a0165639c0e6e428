#include "options_key.h"
#include "export_result.h"
#include "../utils/checksum.h"
#include <algorithm>

static nlohmann::json optionsToJson(const RenderOptions& options) {
    auto codecOptions = options.codec_options;
    std::stable_sort(codecOptions.begin(), codecOptions.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });
    nlohmann::json codec = nlohmann::json::array();
    for (const auto& [key, value] : codecOptions) {
        codec.push_back({key, value});
    }

    return {
        {"width", options.width},
        {"height", options.height},
        {"dpi", options.dpi},
        {"video_width", options.video_width},
        {"video_height", options.video_height},
        {"fps", options.fps},
        {"slide_duration_secs", options.slide_duration_secs},
        {"total_video_duration_secs", options.total_video_duration_secs},
        {"jpeg_quality", options.jpeg_quality},
        {"fill_color", options.fill_color},
        {"naming", namingSchemeName(options.naming)},
        {"video_codec", options.video_codec},
        {"codec_options", codec},
    };
}

nlohmann::json canonicalRequestJson(const ExportRequest& request, const std::vector<ExportFormat>& formats) {
    const Presentation& p = request.presentation;

    nlohmann::json slides = nlohmann::json::array();
    for (const auto& slide : p.slides()) {
        nlohmann::json s = {
            {"presentation", slide.presentation_id},
            {"slide", slide.slide_id},
        };
        s["duration"] = slide.duration_secs ? nlohmann::json(*slide.duration_secs) : nlohmann::json();
        slides.push_back(std::move(s));
    }

    nlohmann::json formatTags = nlohmann::json::array();
    for (ExportFormat format : formats) {
        formatTags.push_back(formatName(format));
    }

    // nlohmann::json objects keep keys sorted, so dump() is canonical
    return {
        {"presentation", {
            {"id", p.id()},
            {"name", p.name()},
            {"kind", presentationKindName(p.kind())},
            {"parent_path", p.parentPath()},
            {"slides", slides},
        }},
        {"formats", formatTags},
        {"options", optionsToJson(request.options)},
        {"output_root", request.output_root.lexically_normal().generic_string()},
    };
}

std::string computeOptionsKey(const ExportRequest& request) {
    validateRequest(request);
    auto formats = normalizeFormats(request.formats);
    return toHex64(fnv1a64(canonicalRequestJson(request, formats).dump()));
}

std::string computeFormatKey(const ExportRequest& request, ExportFormat format) {
    validateRequest(request);
    if (!isKnownFormat(format)) {
        throw InvalidRequestError("unknown export format tag " + std::to_string(static_cast<int>(format)));
    }
    return toHex64(fnv1a64(canonicalRequestJson(request, {format}).dump()));
}
