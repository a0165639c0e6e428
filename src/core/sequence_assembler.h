#ifndef SEQUENCE_ASSEMBLER_H
#define SEQUENCE_ASSEMBLER_H

#include "export_request.h"
#include "include/core/SkImage.h"
#include <filesystem>
#include <string>
#include <vector>

// One slide's contribution to the video
struct SequenceFrame {
    int slide_index = 0;
    double duration_secs = 0.0;
    sk_sp<SkImage> image;
};

struct AssemblyResult {
    int frame_count = 0;
    std::vector<int> frames_per_slide;   // in slide order
    std::string codec;
    std::string error;

    bool success() const { return error.empty(); }
};

// Frames per slide: max(1, round(duration * fps)). Each slide drifts at most 1/fps.
// Throws InvalidRequestError when a count is not finite or does not fit in an int.
std::vector<int> planFrames(const std::vector<double>& durations, double fps);

// Sort frames by slide index, validate them and mux the repeated frames into
// an MP4 at outputPath. All validation happens before the encoder is opened;
// any failure is reported through AssemblyResult::error.
AssemblyResult assembleVideo(
    std::vector<SequenceFrame> frames,
    const RenderOptions& options,
    const std::filesystem::path& outputPath
);

#endif // SEQUENCE_ASSEMBLER_H
