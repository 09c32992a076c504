#pragma once

#include <string>

#include "scene/types.hpp"

namespace vcomp {

// Canvas heuristics
constexpr int DEFAULT_FPS = 30;
constexpr int DEFAULT_IMAGE_FPS = 30;

// Quality defaults per codec
constexpr int H264_CRF = 18;
constexpr const char* H264_PRESET = "medium";
constexpr int VP9_CRF = 32;
constexpr int WEBM_ALPHA_CRF = 28;
constexpr const char* AUDIO_BITRATE = "320k";

// Luma level at which a stacked/split mask becomes opaque; 0 keeps soft edges
constexpr int MASK_THRESHOLD = 128;

namespace config {

/**
 * Process-wide defaults table
 *
 * Every value the compiler falls back to when a scene or profile leaves
 * it open. Installed once at startup; compilations may pass their own copy.
 */
class Defaults {
public:
    Defaults();

    bool load_from_file(const std::string& path);
    bool save_to_file(const std::string& path) const;

    std::string ffmpeg_path;
    scene::FrameRate fps;
    scene::FrameRate image_fps;
    int h264_crf;
    std::string h264_preset;
    int vp9_crf;
    int webm_alpha_crf;
    std::string audio_bitrate;
    int mask_threshold;
    double engine_timeout;      // seconds, 0 = none
    bool log_diagnostics;
};

// Replace the process-wide table; call before the first compilation
void install(const Defaults& defaults);

const Defaults& current();

} // namespace config
} // namespace vcomp
