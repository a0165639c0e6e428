#ifndef EXPORT_REQUEST_H
#define EXPORT_REQUEST_H

#include "export_format.h"
#include "presentation.h"
#include <cstdint>
#include <filesystem>
#include <limits>
#include <string>
#include <utility>
#include <vector>

// How per-slide artifacts are named inside the presentation directory
enum class NamingScheme {
    kIndex,   // <slide-index>.<ext>
    kNamed,   // <name>_slide_<NN>_<slide-id>.<ext>
};

const char* namingSchemeName(NamingScheme scheme);
// Throws InvalidRequestError for anything but "index" / "named"
NamingScheme parseNamingScheme(const std::string& value);

// Every knob that affects rendered output. All fields take part in the options key.
struct RenderOptions {
    int width = 1920;                  // still resolution; 0x0 derives it from dpi
    int height = 1080;
    float dpi = 0.0f;                  // used only when width/height are 0
    int video_width = 0;               // 0x0 uses the still resolution
    int video_height = 0;
    double fps = 10.0;
    double slide_duration_secs = 20.0;
    double total_video_duration_secs = 0.0;   // > 0 spreads this evenly across slides
    int jpeg_quality = 90;
    uint32_t fill_color = 0xFF000000;  // letterbox, ARGB
    NamingScheme naming = NamingScheme::kIndex;
    std::string video_codec = "libx264";
    std::vector<std::pair<std::string, std::string>> codec_options;
};

struct ExportRequest {
    Presentation presentation;
    std::vector<ExportFormat> formats;
    RenderOptions options;
    std::filesystem::path output_root;
};

struct PixelSize {
    int width = 0;
    int height = 0;

    bool operator==(const PixelSize& other) const { return width == other.width && height == other.height; }
    bool operator!=(const PixelSize& other) const { return !(*this == other); }
    bool operator<(const PixelSize& other) const {
        return width != other.width ? width < other.width : height < other.height;
    }
};

// Longest run of repeated frames one slide may take in a video
constexpr double kMaxFramesPerSlide = static_cast<double>(std::numeric_limits<int>::max());

// Throw InvalidRequestError when options are structurally invalid
void validateRenderOptions(const RenderOptions& options);

// Throw InvalidRequestError when the request cannot be exported at all
// (options, empty or unknown formats, empty explicit slide list, missing ids)
void validateRequest(const ExportRequest& request);

// Display duration of each slide in seconds, in slide order
std::vector<double> effectiveDurations(const Presentation& presentation, const RenderOptions& options);

// Target still resolution for a slide with the given intrinsic size (points)
PixelSize stillSize(const RenderOptions& options, float intrinsicWidth, float intrinsicHeight);

// Target video resolution; derived sizes are rounded down to even dimensions
PixelSize videoSize(const RenderOptions& options, float intrinsicWidth, float intrinsicHeight);

#endif // EXPORT_REQUEST_H
