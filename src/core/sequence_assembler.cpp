#include "sequence_assembler.h"
#include "export_result.h"
#include "video_encoder.h"
#include "../utils/logging.h"
#include <algorithm>
#include <cmath>

std::vector<int> planFrames(const std::vector<double>& durations, double fps) {
    std::vector<int> counts;
    counts.reserve(durations.size());
    for (double duration : durations) {
        double exact = duration * fps;
        if (!std::isfinite(exact) || exact > kMaxFramesPerSlide) {
            throw InvalidRequestError("cannot show a slide for " + std::to_string(duration) + "s at " +
                                      std::to_string(fps) + " fps");
        }
        long long frames = std::llround(exact);
        counts.push_back(static_cast<int>(std::max(1LL, frames)));
    }
    return counts;
}

static std::string sizeString(const sk_sp<SkImage>& image) {
    return std::to_string(image->width()) + "x" + std::to_string(image->height());
}

AssemblyResult assembleVideo(
    std::vector<SequenceFrame> frames,
    const RenderOptions& options,
    const std::filesystem::path& outputPath
) {
    AssemblyResult result;
    if (frames.empty()) {
        result.error = "no frames to assemble";
        return result;
    }
    if (!(options.fps > 0.0)) {
        result.error = "frame rate must be positive";
        return result;
    }

    // Completion order of the render pool is irrelevant; slide order is not
    std::stable_sort(frames.begin(), frames.end(), [](const SequenceFrame& a, const SequenceFrame& b) {
        return a.slide_index < b.slide_index;
    });

    for (const auto& frame : frames) {
        if (!frame.image) {
            result.error = "slide " + std::to_string(frame.slide_index) + " has no rendered image";
            return result;
        }
        if (!(frame.duration_secs > 0.0)) {
            result.error = "slide " + std::to_string(frame.slide_index) + " has a non-positive duration";
            return result;
        }
    }
    const sk_sp<SkImage>& first = frames.front().image;
    for (const auto& frame : frames) {
        if (frame.image->width() != first->width() || frame.image->height() != first->height()) {
            result.error = "resolution mismatch: slide " + std::to_string(frame.slide_index) + " is " +
                           sizeString(frame.image) + ", expected " + sizeString(first);
            return result;
        }
    }
    if ((first->width() % 2) != 0 || (first->height() % 2) != 0) {
        result.error = "video size " + sizeString(first) + " must have even dimensions for yuv420p";
        return result;
    }

    std::vector<double> durations;
    for (const auto& frame : frames) {
        durations.push_back(frame.duration_secs);
    }
    try {
        result.frames_per_slide = planFrames(durations, options.fps);
    } catch (const InvalidRequestError& e) {
        result.error = e.what();
        return result;
    }

    VideoEncoderConfig config;
    config.output_path = outputPath.string();
    config.width = first->width();
    config.height = first->height();
    config.fps = options.fps;
    config.codec = options.video_codec;
    config.codec_options = options.codec_options;

    VideoEncoder encoder;
    if (!encoder.open(config, result.error)) {
        return result;
    }
    result.codec = encoder.codecName();
    for (size_t i = 0; i < frames.size(); ++i) {
        if (!encoder.writeImage(frames[i].image, result.frames_per_slide[i], result.error)) {
            result.error = "slide " + std::to_string(frames[i].slide_index) + ": " + result.error;
            return result;
        }
    }
    if (!encoder.finish(result.error)) {
        return result;
    }
    result.frame_count = encoder.framesWritten();

    LOG_DEBUG("Assembled " << result.frame_count << " frames from " << frames.size() << " slides with "
              << result.codec << " -> " << outputPath.string());
    return result;
}
