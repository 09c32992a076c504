/**
 * Timing Resolver Implementation
 */

#include "timing.hpp"
#include "scene/errors.hpp"
#include "utils/format.hpp"

#include <cmath>

namespace vcomp {
namespace compiler {

namespace {

int64_t checked_ticks(double seconds, const char* what) {
    if (!std::isfinite(seconds)) {
        throw ConfigurationError(std::string("layer ") + what + " must be finite");
    }
    if (seconds < 0.0) {
        throw ConfigurationError(std::string("layer ") + what + " must not be negative, got " +
                                 utils::format_number(seconds));
    }
    return to_microseconds(seconds);
}

} // namespace

int64_t to_microseconds(double seconds) {
    return static_cast<int64_t>(std::llround(seconds * 1000000.0));
}

double to_seconds(int64_t microseconds) {
    return static_cast<double>(microseconds) / 1000000.0;
}

std::optional<int64_t> TimeWindow::duration_us() const {
    if (!end_us) return std::nullopt;
    return *end_us - start_us;
}

std::optional<double> TimeWindow::end() const {
    if (!end_us) return std::nullopt;
    return to_seconds(*end_us);
}

std::optional<double> TimeWindow::duration() const {
    if (!end_us) return std::nullopt;
    return to_seconds(*end_us - start_us);
}

TimeWindow resolve_timing(const scene::TimingSpec& spec) {
    std::optional<int64_t> start;
    std::optional<int64_t> end;
    std::optional<int64_t> duration;

    if (spec.start) start = checked_ticks(*spec.start, "start");
    if (spec.end) end = checked_ticks(*spec.end, "end");
    if (spec.duration) {
        duration = checked_ticks(*spec.duration, "duration");
        if (*duration <= 0) {
            throw ConfigurationError("layer duration must be positive, got " +
                                     utils::format_number(*spec.duration));
        }
    }

    TimeWindow window;
    if (start && end && duration) {
        if (*start + *duration != *end) {
            throw ConfigurationError("layer timing is inconsistent: start " +
                                     utils::format_seconds(*start) + " + duration " +
                                     utils::format_seconds(*duration) + " != end " +
                                     utils::format_seconds(*end));
        }
        window.start_us = *start;
        window.end_us = *end;
    } else if (start && end) {
        window.start_us = *start;
        window.end_us = *end;
    } else if (start && duration) {
        window.start_us = *start;
        window.end_us = *start + *duration;
    } else if (end && duration) {
        if (*duration > *end) {
            throw ConfigurationError("layer duration " + utils::format_seconds(*duration) +
                                     " reaches before time 0 for end " +
                                     utils::format_seconds(*end));
        }
        window.start_us = *end - *duration;
        window.end_us = *end;
    } else if (start) {
        window.start_us = *start;
    } else if (end) {
        window.end_us = *end;
    } else if (duration) {
        window.end_us = *duration;
    }

    if (window.end_us && *window.end_us < window.start_us) {
        throw ConfigurationError("layer end " + utils::format_seconds(*window.end_us) +
                                 " is before its start " + utils::format_seconds(window.start_us));
    }
    return window;
}

EnablePredicate::EnablePredicate(const TimeWindow& window)
    : window_(window)
{
}

std::string EnablePredicate::expression() const {
    if (always()) return "1";

    std::string start = "gte(t," + utils::format_seconds(window_.start_us) + ")";
    if (!window_.end_us) return start;

    std::string end = "lt(t," + utils::format_seconds(*window_.end_us) + ")";
    if (window_.start_us == 0) return end;
    return start + "*" + end;
}

bool EnablePredicate::contains(double t) const {
    int64_t ticks = to_microseconds(t);
    if (ticks < window_.start_us) return false;
    if (window_.end_us && ticks >= *window_.end_us) return false;
    return true;
}

} // namespace compiler
} // namespace vcomp
