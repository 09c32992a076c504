/**
 * Defaults Table Implementation
 */

#include "defaults.hpp"
#include <fstream>
#include <cstdio>
#include <stdexcept>

namespace vcomp {
namespace config {

namespace {

Defaults& global_defaults() {
    static Defaults defaults;
    return defaults;
}

bool parse_bool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

} // namespace

Defaults::Defaults()
    : ffmpeg_path("ffmpeg")
    , fps(DEFAULT_FPS, 1)
    , image_fps(DEFAULT_IMAGE_FPS, 1)
    , h264_crf(H264_CRF)
    , h264_preset(H264_PRESET)
    , vp9_crf(VP9_CRF)
    , webm_alpha_crf(WEBM_ALPHA_CRF)
    , audio_bitrate(AUDIO_BITRATE)
    , mask_threshold(MASK_THRESHOLD)
    , engine_timeout(0.0)
    , log_diagnostics(true)
{
}

bool Defaults::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        fprintf(stderr, "[Config] Failed to open: %s\n", path.c_str());
        return false;
    }

    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        line_number++;

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') continue;

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = line.substr(0, eq_pos);
        std::string value = line.substr(eq_pos + 1);

        // Trim whitespace
        while (!key.empty() && (key.back() == ' ' || key.back() == '\t')) key.pop_back();
        while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) value.erase(0, 1);
        while (!value.empty() && (value.back() == ' ' || value.back() == '\t' || value.back() == '\r')) value.pop_back();

        try {
            if (key == "ffmpeg_path") ffmpeg_path = value;
            else if (key == "fps") fps = scene::FrameRate::from_double(std::stod(value));
            else if (key == "image_fps") image_fps = scene::FrameRate::from_double(std::stod(value));
            else if (key == "h264_crf") h264_crf = std::stoi(value);
            else if (key == "h264_preset") h264_preset = value;
            else if (key == "vp9_crf") vp9_crf = std::stoi(value);
            else if (key == "webm_alpha_crf") webm_alpha_crf = std::stoi(value);
            else if (key == "audio_bitrate") audio_bitrate = value;
            else if (key == "mask_threshold") mask_threshold = std::stoi(value);
            else if (key == "engine_timeout") engine_timeout = std::stod(value);
            else if (key == "log_diagnostics") log_diagnostics = parse_bool(value);
            else fprintf(stderr, "[Config] Ignoring unknown key '%s' (line %d)\n", key.c_str(), line_number);
        } catch (const std::exception& ex) {
            fprintf(stderr, "[Config] Bad value for '%s' (line %d): %s\n",
                    key.c_str(), line_number, ex.what());
            return false;
        }
    }

    if (mask_threshold < 0 || mask_threshold > 255) {
        fprintf(stderr, "[Config] mask_threshold out of range: %d\n", mask_threshold);
        return false;
    }

    fprintf(stderr, "[Config] Loaded: ffmpeg=%s, fps=%s, h264 crf=%d/%s, vp9 crf=%d\n",
            ffmpeg_path.c_str(), fps.to_string().c_str(), h264_crf,
            h264_preset.c_str(), vp9_crf);

    return true;
}

bool Defaults::save_to_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        fprintf(stderr, "[Config] Failed to write: %s\n", path.c_str());
        return false;
    }

    file << "# Composition compiler defaults\n\n";
    file << "# Engine\n";
    file << "ffmpeg_path=" << ffmpeg_path << "\n";
    file << "engine_timeout=" << engine_timeout << "\n";
    file << "\n# Canvas fallbacks\n";
    file << "fps=" << fps.value() << "\n";
    file << "image_fps=" << image_fps.value() << "\n";
    file << "\n# Encoding\n";
    file << "h264_crf=" << h264_crf << "\n";
    file << "h264_preset=" << h264_preset << "\n";
    file << "vp9_crf=" << vp9_crf << "\n";
    file << "webm_alpha_crf=" << webm_alpha_crf << "\n";
    file << "audio_bitrate=" << audio_bitrate << "\n";
    file << "\n# Ingestion\n";
    file << "mask_threshold=" << mask_threshold << "\n";
    file << "log_diagnostics=" << (log_diagnostics ? "true" : "false") << "\n";

    return true;
}

void install(const Defaults& defaults) {
    global_defaults() = defaults;
}

const Defaults& current() {
    return global_defaults();
}

} // namespace config
} // namespace vcomp
