#pragma once

#include <string>

#include "scene/foreground.hpp"

// Forward declarations for FFmpeg types
struct AVFormatContext;

namespace vcomp {
namespace pipeline {

/**
 * Media Probe
 *
 * Reads container and stream headers with libavformat to describe a
 * source file. Never decodes a frame.
 */
class MediaProbe {
public:
    MediaProbe();
    ~MediaProbe();

    MediaProbe(const MediaProbe&) = delete;
    MediaProbe& operator=(const MediaProbe&) = delete;

    // Open a file and read its stream headers
    bool open(const std::string& path);

    // Close and release resources
    void close();

    const scene::MediaInfo& info() const { return info_; }
    bool is_open() const { return is_open_; }

private:
    AVFormatContext* format_ctx_;
    int video_stream_idx_;
    scene::MediaInfo info_;
    bool is_open_;
};

// One-shot probe; false when the file cannot be read
bool probe_media(const std::string& path, scene::MediaInfo& info);

} // namespace pipeline
} // namespace vcomp
