/**
 * Engine Runner Implementation
 */

#include "engine_runner.hpp"
#include "scene/errors.hpp"
#include "utils/cancel_flag.hpp"

#include <chrono>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace vcomp {
namespace pipeline {

namespace {

constexpr int kPollIntervalMs = 100;
constexpr double kKillGraceSeconds = 5.0;

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace

EngineRunner::EngineRunner(const std::string& engine_path)
    : engine_path_(engine_path)
    , timeout_(0.0)
{
}

void EngineRunner::set_progress_callback(ProgressCallback callback) {
    progress_callback_ = callback;
}

void EngineRunner::set_output_callback(OutputCallback callback) {
    output_callback_ = callback;
}

void EngineRunner::set_timeout(double seconds) {
    timeout_ = seconds > 0.0 ? seconds : 0.0;
}

bool EngineRunner::parse_progress(const std::string& line, double* seconds, double* speed) {
    size_t pos = line.rfind("time=");
    if (pos == std::string::npos) return false;

    int h = 0;
    int m = 0;
    double s = 0.0;
    if (std::sscanf(line.c_str() + pos + 5, "%d:%d:%lf", &h, &m, &s) != 3) return false;
    if (seconds) *seconds = h * 3600.0 + m * 60.0 + s;

    if (speed) {
        *speed = 0.0;
        size_t sp = line.rfind("speed=");
        if (sp != std::string::npos) {
            double value = 0.0;
            if (std::sscanf(line.c_str() + sp + 6, "%lfx", &value) == 1) *speed = value;
        }
    }
    return true;
}

EngineResult EngineRunner::run(const compiler::CompiledProgram& program) {
    double total = program.duration().value_or(0.0);
    fprintf(stderr, "[Engine] Running: %s\n", program.command_line(engine_path_).c_str());
    return execute(program.argv(engine_path_), total);
}

void EngineRunner::render(const compiler::CompiledProgram& program) {
    EngineResult result = run(program);
    if (result.cancelled) {
        throw CompositionError("render cancelled");
    }
    if (result.timed_out) {
        throw CompositionError("render timed out after " + std::to_string(timeout_) + "s");
    }
    if (result.exit_code != 0) {
        throw EngineError(result.exit_code, result.diagnostics);
    }
    fprintf(stderr, "[Engine] Completed in %.1f seconds: %s\n", result.elapsed,
            program.output().url().c_str());
}

EngineResult EngineRunner::execute(const std::vector<std::string>& argv, double total) {
    EngineResult result;

    // A request left over from an earlier run does not carry into this one
    utils::reset_cancel();

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0) {
        result.diagnostics = std::string("pipe failed: ") + std::strerror(errno);
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return result;
    }

    std::vector<char*> args;
    for (const auto& arg : argv) args.push_back(const_cast<char*>(arg.c_str()));
    args.push_back(nullptr);

    auto start_time = std::chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        result.diagnostics = std::string("fork failed: ") + std::strerror(errno);
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
        return result;
    }

    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        execvp(args[0], args.data());
        std::fprintf(stderr, "exec %s failed: %s\n", args[0], std::strerror(errno));
        _exit(127);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    std::string status_line;
    char buf[65536];
    bool terminated = false;
    double kill_deadline = 0.0;

    while (out_pipe[0] >= 0 || err_pipe[0] >= 0) {
        struct pollfd fds[2];
        nfds_t count = 0;
        if (out_pipe[0] >= 0) fds[count++] = {out_pipe[0], POLLIN, 0};
        if (err_pipe[0] >= 0) fds[count++] = {err_pipe[0], POLLIN, 0};

        int ready = poll(fds, count, kPollIntervalMs);
        if (ready < 0 && errno != EINTR) break;

        for (nfds_t i = 0; ready > 0 && i < count; i++) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;

            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            bool is_out = fds[i].fd == out_pipe[0];
            if (n <= 0) {
                close_fd(is_out ? out_pipe[0] : err_pipe[0]);
                continue;
            }

            if (is_out) {
                if (output_callback_) output_callback_(buf, static_cast<size_t>(n));
                continue;
            }

            result.diagnostics.append(buf, static_cast<size_t>(n));
            for (ssize_t k = 0; k < n; k++) {
                char c = buf[k];
                if (c == '\r' || c == '\n') {
                    double done = 0.0;
                    double speed = 0.0;
                    if (progress_callback_ && parse_progress(status_line, &done, &speed)) {
                        progress_callback_(done, total, speed);
                    }
                    status_line.clear();
                } else {
                    status_line += c;
                }
            }
        }

        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();
        if (!terminated) {
            if (utils::is_cancel_requested()) {
                fprintf(stderr, "[Engine] Cancel requested, stopping engine\n");
                result.cancelled = true;
            } else if (timeout_ > 0.0 && elapsed > timeout_) {
                fprintf(stderr, "[Engine] Timeout after %.1f seconds, stopping engine\n", elapsed);
                result.timed_out = true;
            }
            if (result.cancelled || result.timed_out) {
                kill(pid, SIGTERM);
                terminated = true;
                kill_deadline = elapsed + kKillGraceSeconds;
            }
        } else if (elapsed > kill_deadline) {
            kill(pid, SIGKILL);
            kill_deadline = elapsed + kKillGraceSeconds;
        }
    }
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) break;
    }

    if (WIFEXITED(status)) result.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) result.exit_code = 128 + WTERMSIG(status);

    result.elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();
    return result;
}

} // namespace pipeline
} // namespace vcomp
