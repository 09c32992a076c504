/**
 * Media Probe Implementation
 */

#include "media_probe.hpp"
#include "config/defaults.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/display.h>
#include <libavutil/pixdesc.h>
}

#include <cmath>
#include <cstdio>
#include <utility>

namespace vcomp {
namespace pipeline {

namespace {

int display_rotation(const AVCodecParameters* codecpar) {
    const AVPacketSideData* sd = av_packet_side_data_get(codecpar->coded_side_data,
                                                         codecpar->nb_coded_side_data,
                                                         AV_PKT_DATA_DISPLAYMATRIX);
    if (!sd || sd->size < 9 * sizeof(int32_t)) return 0;

    double angle = -av_display_rotation_get(reinterpret_cast<const int32_t*>(sd->data));
    if (std::isnan(angle)) return 0;

    int degrees = static_cast<int>(std::lround(angle)) % 360;
    if (degrees < 0) degrees += 360;
    return degrees;
}

} // namespace

MediaProbe::MediaProbe()
    : format_ctx_(nullptr)
    , video_stream_idx_(-1)
    , is_open_(false)
{
}

MediaProbe::~MediaProbe() {
    close();
}

bool MediaProbe::open(const std::string& path) {
    close();
    info_ = scene::MediaInfo();

    // Open input file
    if (avformat_open_input(&format_ctx_, path.c_str(), nullptr, nullptr) < 0) {
        fprintf(stderr, "[Probe] Failed to open: %s\n", path.c_str());
        return false;
    }

    // Find stream info
    if (avformat_find_stream_info(format_ctx_, nullptr) < 0) {
        fprintf(stderr, "[Probe] Failed to find stream info: %s\n", path.c_str());
        close();
        return false;
    }

    // Find video stream
    video_stream_idx_ = av_find_best_stream(format_ctx_, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (video_stream_idx_ < 0) {
        fprintf(stderr, "[Probe] No video stream found: %s\n", path.c_str());
        close();
        return false;
    }

    for (unsigned int i = 0; i < format_ctx_->nb_streams; i++) {
        if (format_ctx_->streams[i]->codecpar->codec_type == AVMEDIA_TYPE_AUDIO) {
            info_.has_audio = true;
            break;
        }
    }

    AVStream* video_stream = format_ctx_->streams[video_stream_idx_];
    AVCodecParameters* codecpar = video_stream->codecpar;

    info_.width = codecpar->width;
    info_.height = codecpar->height;
    info_.codec = avcodec_get_name(codecpar->codec_id);

    AVRational rate = video_stream->avg_frame_rate;
    if (rate.num <= 0 || rate.den <= 0) rate = video_stream->r_frame_rate;
    if (rate.num > 0 && rate.den > 0) {
        info_.fps = scene::FrameRate(rate.num, rate.den);
    } else {
        info_.fps = config::current().image_fps;
    }

    if (video_stream->duration != AV_NOPTS_VALUE) {
        info_.duration = video_stream->duration * av_q2d(video_stream->time_base);
    } else if (format_ctx_->duration != AV_NOPTS_VALUE) {
        info_.duration = static_cast<double>(format_ctx_->duration) / AV_TIME_BASE;
    }

    const AVPixFmtDescriptor* desc = av_pix_fmt_desc_get(static_cast<AVPixelFormat>(codecpar->format));
    if (desc) {
        info_.pix_fmt = desc->name;
        info_.has_alpha = (desc->flags & AV_PIX_FMT_FLAG_ALPHA) != 0;
    }
    // VP9 keeps alpha in block additions, flagged on the stream
    const AVDictionaryEntry* alpha_mode = av_dict_get(video_stream->metadata, "alpha_mode", nullptr, 0);
    if (alpha_mode && std::string(alpha_mode->value) == "1") {
        info_.has_alpha = true;
    }

    info_.rotation = display_rotation(codecpar);
    if (info_.rotation == 90 || info_.rotation == 270) {
        std::swap(info_.width, info_.height);
    }

    is_open_ = true;
    fprintf(stderr, "[Probe] Opened: %s %dx%d @ %s fps, %.2fs, %s%s%s\n",
            path.c_str(), info_.width, info_.height, info_.fps.to_string().c_str(),
            info_.duration, info_.codec.c_str(),
            info_.has_alpha ? ", alpha" : "", info_.has_audio ? ", audio" : "");

    return true;
}

void MediaProbe::close() {
    if (format_ctx_) {
        avformat_close_input(&format_ctx_);
    }
    video_stream_idx_ = -1;
    is_open_ = false;
}

bool probe_media(const std::string& path, scene::MediaInfo& info) {
    MediaProbe probe;
    if (!probe.open(path)) return false;
    info = probe.info();
    return true;
}

} // namespace pipeline
} // namespace vcomp
