/**
 * Composition Renderer - Main Entry Point
 *
 * CLI tool that compiles a JSON scene into a media-engine program and
 * runs it, or prints it for inspection.
 *
 * Usage:
 *   ./vcomp_render --scene <path> [options]
 *
 * Options:
 *   --scene, -s     Scene description (JSON)
 *   --output, -o    Output file (overrides the scene)
 *   --stream        Write to stdout in a stream format (y4m, webm, matroska, mp4_fragmented)
 *   --dry-run       Print the engine command instead of running it
 *   --json          Print the compiled program as JSON
 *   --validate      Parse the filter graph with libavfilter before running
 *   --config        Defaults file (key=value)
 *   --save-config   Write the effective defaults to a file and exit
 *   --ffmpeg        Engine binary (default: ffmpeg)
 *   --timeout       Engine timeout in seconds
 *   --help, -h      Show help message
 */

#include <iostream>
#include <string>
#include <cstdlib>
#include <cstdio>
#include <exception>
#include <unistd.h>

#include <json/json.h>

#include "compiler/compiler.hpp"
#include "config/defaults.hpp"
#include "pipeline/engine_runner.hpp"
#include "pipeline/graph_validator.hpp"
#include "pipeline/media_probe.hpp"
#include "pipeline/scene_loader.hpp"
#include "scene/errors.hpp"
#include "utils/cancel_flag.hpp"

void print_usage(const char* prog_name) {
    std::cout << "\nLayered Video Composition Renderer\n";
    std::cout << "==================================\n\n";
    std::cout << "Usage: " << prog_name << " --scene <path> [options]\n\n";
    std::cout << "Required:\n";
    std::cout << "  --scene, -s     Scene description (JSON)\n\n";
    std::cout << "Options:\n";
    std::cout << "  --output, -o    Output file (overrides the scene)\n";
    std::cout << "  --stream        Write to stdout: y4m, webm, matroska, mp4_fragmented\n";
    std::cout << "  --dry-run       Print the engine command instead of running it\n";
    std::cout << "  --json          Print the compiled program as JSON\n";
    std::cout << "  --validate      Check the filter graph with libavfilter first\n";
    std::cout << "  --config        Defaults file (key=value)\n";
    std::cout << "  --save-config   Write the effective defaults to a file and exit\n";
    std::cout << "  --ffmpeg        Engine binary (default: ffmpeg)\n";
    std::cout << "  --timeout       Engine timeout in seconds (default: none)\n";
    std::cout << "  --help, -h      Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << prog_name << " -s scene.json -o out.mp4\n";
    std::cout << "  " << prog_name << " -s scene.json --dry-run\n";
    std::cout << "  " << prog_name << " -s scene.json --stream webm > out.webm\n\n";
}

int main(int argc, char* argv[]) {
    vcomp::utils::install_signal_handlers();

    // Parse arguments
    std::string scene_path;
    std::string output_path;
    std::string stream_name;
    std::string config_path;
    std::string save_config_path;
    std::string ffmpeg_path;
    double timeout = -1.0;
    bool dry_run = false;
    bool print_json = false;
    bool validate = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        else if (arg == "--scene" || arg == "-s") {
            if (i + 1 < argc) scene_path = argv[++i];
        }
        else if (arg == "--output" || arg == "-o") {
            if (i + 1 < argc) output_path = argv[++i];
        }
        else if (arg == "--stream") {
            if (i + 1 < argc) stream_name = argv[++i];
        }
        else if (arg == "--config") {
            if (i + 1 < argc) config_path = argv[++i];
        }
        else if (arg == "--save-config") {
            if (i + 1 < argc) save_config_path = argv[++i];
        }
        else if (arg == "--ffmpeg") {
            if (i + 1 < argc) ffmpeg_path = argv[++i];
        }
        else if (arg == "--timeout") {
            if (i + 1 < argc) timeout = std::atof(argv[++i]);
        }
        else if (arg == "--dry-run") {
            dry_run = true;
        }
        else if (arg == "--json") {
            print_json = true;
        }
        else if (arg == "--validate") {
            validate = true;
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    // Keep the real stdout for engine bytes; nothing of ours may reach it
    int stream_fd = -1;
    if (!stream_name.empty() && !dry_run) {
        fflush(stdout);
        stream_fd = dup(STDOUT_FILENO);
        dup2(STDERR_FILENO, STDOUT_FILENO);
    }

    // Defaults table, fixed before anything compiles
    vcomp::config::Defaults defaults;
    if (!config_path.empty() && !defaults.load_from_file(config_path)) {
        std::cerr << "Error: cannot load config " << config_path << "\n";
        return 1;
    }
    if (!ffmpeg_path.empty()) defaults.ffmpeg_path = ffmpeg_path;
    if (timeout >= 0.0) defaults.engine_timeout = timeout;
    vcomp::config::install(defaults);

    if (!save_config_path.empty()) {
        return defaults.save_to_file(save_config_path) ? 0 : 1;
    }

    // Validate required arguments
    if (scene_path.empty()) {
        std::cerr << "Error: --scene is required\n";
        print_usage(argv[0]);
        return 1;
    }
    if (!output_path.empty() && !stream_name.empty()) {
        std::cerr << "Error: --output and --stream are mutually exclusive\n";
        return 1;
    }

    try {
        vcomp::pipeline::SceneLoader loader(vcomp::pipeline::probe_media);
        vcomp::pipeline::SceneFile scene = loader.load_file(scene_path);

        if (!output_path.empty()) {
            scene.output = vcomp::compiler::OutputTarget::file(output_path);
        } else if (!stream_name.empty()) {
            vcomp::compiler::StreamFormat format;
            if (!vcomp::compiler::parse_stream_format(stream_name, format)) {
                std::cerr << "Error: unknown stream format " << stream_name << "\n";
                return 1;
            }
            scene.output = vcomp::compiler::OutputTarget::pipe(format);
        }
        if (scene.output.path.empty()) {
            std::cerr << "Error: no output; set \"output\" in the scene or pass --output\n";
            return 1;
        }

        vcomp::compiler::CompositionCompiler compiler(defaults);
        vcomp::compiler::CompiledProgram program =
            compiler.compile(scene.composition, scene.profile, scene.output);

        std::cerr << "[Config] Canvas: " << program.canvas().width << "x" << program.canvas().height
                  << " @ " << program.canvas().fps.to_string() << " fps\n";
        std::cerr << "[Config] Encoder: " << vcomp::compiler::to_string(scene.profile.kind()) << "\n";

        if (validate) {
            vcomp::pipeline::GraphValidator validator;
            std::string error;
            if (!validator.validate(program, &error)) {
                std::cerr << "[Error] Invalid filter graph: " << error << "\n";
                return 1;
            }
        }

        if (print_json) {
            Json::Value root;
            program.json_summary(root);
            std::cout << root << "\n";
        }

        if (dry_run) {
            std::cout << program.command_line(defaults.ffmpeg_path) << "\n";
            return 0;
        }

        vcomp::pipeline::EngineRunner runner(defaults.ffmpeg_path);
        runner.set_timeout(defaults.engine_timeout);

        if (stream_fd >= 0) {
            runner.set_output_callback([stream_fd](const char* data, size_t size) {
                while (size > 0) {
                    ssize_t n = write(stream_fd, data, size);
                    if (n <= 0) {
                        vcomp::utils::request_cancel();
                        return;
                    }
                    data += n;
                    size -= static_cast<size_t>(n);
                }
            });
        }

        // Set progress callback with percentage bar
        runner.set_progress_callback([](double done, double total, double speed) {
            if (total <= 0.0) return;

            double progress = 100.0 * done / total;
            if (progress > 100.0) progress = 100.0;
            int bar_width = 40;
            int filled = static_cast<int>(progress / 100.0 * bar_width);

            std::cerr << "\r[";
            for (int i = 0; i < bar_width; i++) {
                if (i < filled) std::cerr << "=";
                else if (i == filled) std::cerr << ">";
                else std::cerr << " ";
            }
            std::cerr << "] " << static_cast<int>(progress) << "% @ "
                      << speed << "x   " << std::flush;
        });

        runner.render(program);
    } catch (const vcomp::EngineError& ex) {
        std::cerr << "\n\n[Error] " << ex.what() << "\n" << ex.diagnostics() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        if (vcomp::utils::is_cancel_requested()) {
            int sig = vcomp::utils::cancel_signal();
            if (sig == 0) {
                std::cerr << "\n\n[Cancel] Output reader went away, rendering stopped\n";
                return 1;
            }
            std::cerr << "\n\n[Cancel] Rendering cancelled by user\n";
            return 128 + sig;
        }
        std::cerr << "\n\n[Error] Caught exception: " << ex.what() << "\n";
        return 1;
    }

    std::cerr << "\n\n[Done] Rendering complete!\n";
    return 0;
}
