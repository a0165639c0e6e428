#ifndef VIDEO_ENCODER_H
#define VIDEO_ENCODER_H

#include "include/core/SkImage.h"
#include <string>
#include <utility>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libswscale/swscale.h>
}

struct VideoEncoderConfig {
    std::string output_path;
    int width = 0;
    int height = 0;
    double fps = 10.0;
    std::string codec = "libx264";
    std::vector<std::pair<std::string, std::string>> codec_options;
};

// In-process MP4 writer (libavformat + libavcodec), yuv420p.
// Images are converted once and submitted as repeated frames.
class VideoEncoder {
public:
    VideoEncoder();
    ~VideoEncoder();

    VideoEncoder(const VideoEncoder&) = delete;
    VideoEncoder& operator=(const VideoEncoder&) = delete;

    bool open(const VideoEncoderConfig& cfg, std::string& err);

    // Submit image as `repeat` consecutive frames. The image must match the configured size
    bool writeImage(const sk_sp<SkImage>& image, int repeat, std::string& err);

    // Drain the encoder and write the container trailer
    bool finish(std::string& err);

    // Release everything; an unfinished file is left incomplete
    void close();

    int framesWritten() const { return frameIndex_; }
    const std::string& codecName() const { return codecName_; }

private:
    bool initializeEncoder(std::string& err);
    bool drainPackets(std::string& err);

    VideoEncoderConfig config_;
    AVFormatContext* fmtCtx_ = nullptr;
    AVCodecContext* codecCtx_ = nullptr;
    AVStream* stream_ = nullptr;
    SwsContext* swsCtx_ = nullptr;
    AVFrame* yuvFrame_ = nullptr;
    AVPacket* packet_ = nullptr;
    std::vector<uint8_t> rgba_;
    std::string codecName_;
    int frameIndex_ = 0;
    bool headerWritten_ = false;
    bool finished_ = false;
};

// Human-readable text for an AVERROR code
std::string avErrorString(int code);

#endif // VIDEO_ENCODER_H
