#include "video_encoder.h"
#include "../utils/logging.h"
#include "include/core/SkImageInfo.h"

extern "C" {
#include <libavutil/imgutils.h>
#include <libavutil/opt.h>
}

std::string avErrorString(int code) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(code, buf, sizeof(buf));
    return buf;
}

VideoEncoder::VideoEncoder() = default;

VideoEncoder::~VideoEncoder() {
    close();
}

bool VideoEncoder::open(const VideoEncoderConfig& cfg, std::string& err) {
    close();
    config_ = cfg;
    if (config_.output_path.empty()) {
        err = "Empty video output filename";
        return false;
    }
    if (config_.width <= 0 || config_.height <= 0 || (config_.width % 2) != 0 || (config_.height % 2) != 0) {
        err = "Video size " + std::to_string(config_.width) + "x" + std::to_string(config_.height) +
              " must be positive and even";
        return false;
    }
    if (!(config_.fps > 0.0)) {
        err = "Video frame rate must be positive";
        return false;
    }
    if (!initializeEncoder(err)) {
        close();
        return false;
    }
    return true;
}

void VideoEncoder::close() {
    if (yuvFrame_) av_frame_free(&yuvFrame_);
    if (packet_) av_packet_free(&packet_);
    if (codecCtx_) avcodec_free_context(&codecCtx_);
    if (fmtCtx_) {
        if (!(fmtCtx_->oformat->flags & AVFMT_NOFILE)) {
            avio_closep(&fmtCtx_->pb);
        }
        avformat_free_context(fmtCtx_);
        fmtCtx_ = nullptr;
    }
    if (swsCtx_) {
        sws_freeContext(swsCtx_);
        swsCtx_ = nullptr;
    }
    stream_ = nullptr;
    rgba_.clear();
    frameIndex_ = 0;
    headerWritten_ = false;
    finished_ = false;
}

bool VideoEncoder::initializeEncoder(std::string& err) {
    const AVCodec* codec = avcodec_find_encoder_by_name(config_.codec.c_str());
    if (!codec) {
        LOG_CERR("[WARNING] Encoder '" << config_.codec << "' is not available, falling back to MPEG-4 Part 2");
        codec = avcodec_find_encoder(AV_CODEC_ID_MPEG4);
    }
    if (!codec) {
        err = "No suitable video encoder";
        return false;
    }
    codecName_ = codec->name;

    // Output goes to a temporary name, so the container cannot be guessed from the extension
    int ret = avformat_alloc_output_context2(&fmtCtx_, nullptr, "mp4", config_.output_path.c_str());
    if (ret < 0 || !fmtCtx_) {
        err = "Failed to allocate mp4 output context: " + avErrorString(ret);
        return false;
    }
    stream_ = avformat_new_stream(fmtCtx_, nullptr);
    if (!stream_) {
        err = "Failed to create video stream";
        return false;
    }
    codecCtx_ = avcodec_alloc_context3(codec);
    if (!codecCtx_) {
        err = "Failed to allocate codec context";
        return false;
    }

    AVRational frameRate = av_d2q(config_.fps, 100000);
    codecCtx_->codec_id = codec->id;
    codecCtx_->codec_type = AVMEDIA_TYPE_VIDEO;
    codecCtx_->width = config_.width;
    codecCtx_->height = config_.height;
    codecCtx_->time_base = av_inv_q(frameRate);
    codecCtx_->framerate = frameRate;
    codecCtx_->pix_fmt = AV_PIX_FMT_YUV420P;
    codecCtx_->gop_size = 12;
    codecCtx_->max_b_frames = 2;
    stream_->time_base = codecCtx_->time_base;

    if (codec->id == AV_CODEC_ID_H264 && codecCtx_->priv_data) {
        av_opt_set(codecCtx_->priv_data, "preset", "medium", 0);
        av_opt_set(codecCtx_->priv_data, "crf", "18", 0);
    } else if (codec->id == AV_CODEC_ID_MPEG4) {
        // Constant quantizer instead of the 200 kb/s default bitrate
        codecCtx_->flags |= AV_CODEC_FLAG_QSCALE;
        codecCtx_->global_quality = FF_QP2LAMBDA * 3;
    }
    for (const auto& [key, value] : config_.codec_options) {
        ret = av_opt_set(codecCtx_, key.c_str(), value.c_str(), AV_OPT_SEARCH_CHILDREN);
        if (ret < 0) {
            err = "Codec option " + key + "=" + value + " rejected by " + codecName_ + ": " + avErrorString(ret);
            return false;
        }
    }
    if (fmtCtx_->oformat->flags & AVFMT_GLOBALHEADER) {
        codecCtx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }

    ret = avcodec_open2(codecCtx_, codec, nullptr);
    if (ret < 0) {
        err = "Failed to open encoder " + codecName_ + ": " + avErrorString(ret);
        return false;
    }
    ret = avcodec_parameters_from_context(stream_->codecpar, codecCtx_);
    if (ret < 0) {
        err = "Failed to copy codec parameters: " + avErrorString(ret);
        return false;
    }
    if (!(fmtCtx_->oformat->flags & AVFMT_NOFILE)) {
        ret = avio_open(&fmtCtx_->pb, config_.output_path.c_str(), AVIO_FLAG_WRITE);
        if (ret < 0) {
            err = "Failed to open video output file " + config_.output_path + ": " + avErrorString(ret);
            return false;
        }
    }
    ret = avformat_write_header(fmtCtx_, nullptr);
    if (ret < 0) {
        err = "Failed to write mp4 header: " + avErrorString(ret);
        return false;
    }
    headerWritten_ = true;

    yuvFrame_ = av_frame_alloc();
    packet_ = av_packet_alloc();
    if (!yuvFrame_ || !packet_) {
        err = "Failed to allocate frame buffers";
        return false;
    }
    yuvFrame_->format = codecCtx_->pix_fmt;
    yuvFrame_->width = codecCtx_->width;
    yuvFrame_->height = codecCtx_->height;
    ret = av_frame_get_buffer(yuvFrame_, 32);
    if (ret < 0) {
        err = "Failed to allocate frame: " + avErrorString(ret);
        return false;
    }

    swsCtx_ = sws_getContext(codecCtx_->width, codecCtx_->height, AV_PIX_FMT_RGBA,
                             codecCtx_->width, codecCtx_->height, codecCtx_->pix_fmt,
                             SWS_BICUBIC, nullptr, nullptr, nullptr);
    if (!swsCtx_) {
        err = "Failed to create sws context";
        return false;
    }
    rgba_.resize(static_cast<size_t>(config_.width) * config_.height * 4);

    LOG_DEBUG("Video encoder " << codecName_ << " opened: " << config_.width << "x" << config_.height
              << " @ " << config_.fps << " fps -> " << config_.output_path);
    return true;
}

bool VideoEncoder::writeImage(const sk_sp<SkImage>& image, int repeat, std::string& err) {
    if (!headerWritten_ || finished_) {
        err = "Video encoder is not open";
        return false;
    }
    if (!image || image->width() != config_.width || image->height() != config_.height) {
        err = "Frame size does not match the video size";
        return false;
    }

    SkImageInfo rgbaInfo = SkImageInfo::Make(config_.width, config_.height,
                                             kRGBA_8888_SkColorType, kUnpremul_SkAlphaType);
    size_t rowBytes = static_cast<size_t>(config_.width) * 4;
    if (!image->readPixels(nullptr, rgbaInfo, rgba_.data(), rowBytes, 0, 0)) {
        err = "Failed to read rendered pixels";
        return false;
    }

    // The encoder may still reference the previous buffer
    int ret = av_frame_make_writable(yuvFrame_);
    if (ret < 0) {
        err = "Failed to make frame writable: " + avErrorString(ret);
        return false;
    }
    const uint8_t* srcData[4] = {rgba_.data(), nullptr, nullptr, nullptr};
    const int srcLinesize[4] = {static_cast<int>(rowBytes), 0, 0, 0};
    sws_scale(swsCtx_, srcData, srcLinesize, 0, config_.height, yuvFrame_->data, yuvFrame_->linesize);

    for (int i = 0; i < repeat; ++i) {
        yuvFrame_->pts = frameIndex_++;
        ret = avcodec_send_frame(codecCtx_, yuvFrame_);
        if (ret < 0) {
            err = "Failed to send frame: " + avErrorString(ret);
            return false;
        }
        if (!drainPackets(err)) {
            return false;
        }
    }
    return true;
}

bool VideoEncoder::drainPackets(std::string& err) {
    while (true) {
        int ret = avcodec_receive_packet(codecCtx_, packet_);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
            return true;
        }
        if (ret < 0) {
            err = "Failed to receive packet: " + avErrorString(ret);
            return false;
        }
        packet_->stream_index = stream_->index;
        av_packet_rescale_ts(packet_, codecCtx_->time_base, stream_->time_base);
        ret = av_interleaved_write_frame(fmtCtx_, packet_);
        av_packet_unref(packet_);
        if (ret < 0) {
            err = "Failed to write packet: " + avErrorString(ret);
            return false;
        }
    }
}

bool VideoEncoder::finish(std::string& err) {
    if (!headerWritten_ || finished_) {
        err = "Video encoder is not open";
        return false;
    }
    int ret = avcodec_send_frame(codecCtx_, nullptr);
    if (ret < 0) {
        err = "Failed to flush encoder: " + avErrorString(ret);
        return false;
    }
    if (!drainPackets(err)) {
        return false;
    }
    ret = av_write_trailer(fmtCtx_);
    if (ret < 0) {
        err = "Failed to write mp4 trailer: " + avErrorString(ret);
        return false;
    }
    finished_ = true;
    if (!(fmtCtx_->oformat->flags & AVFMT_NOFILE)) {
        ret = avio_closep(&fmtCtx_->pb);
        if (ret < 0) {
            err = "Failed to close video file: " + avErrorString(ret);
            return false;
        }
    }
    return true;
}
