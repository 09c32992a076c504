#pragma once

#include <string>
#include <optional>
#include <cstdint>

#include "scene/layer.hpp"

namespace vcomp {
namespace compiler {

// Seconds to integer microseconds, rounded to nearest
int64_t to_microseconds(double seconds);
double to_seconds(int64_t microseconds);

/**
 * Canonical [start, end) visibility window in microseconds
 *
 * An absent end means visible until the output ends.
 */
struct TimeWindow {
    int64_t start_us = 0;
    std::optional<int64_t> end_us;

    bool constrained() const { return start_us > 0 || end_us.has_value(); }
    std::optional<int64_t> duration_us() const;

    double start() const { return to_seconds(start_us); }
    std::optional<double> end() const;
    std::optional<double> duration() const;
};

// Derive the missing value; throws ConfigurationError on any invalid combination
TimeWindow resolve_timing(const scene::TimingSpec& spec);

/**
 * Overlay enable predicate, true exactly on [start, end)
 */
class EnablePredicate {
public:
    explicit EnablePredicate(const TimeWindow& window);

    bool always() const { return !window_.constrained(); }

    // gte(t,S)*lt(t,E) / gte(t,S) / lt(t,E) / "1"
    std::string expression() const;

    // Evaluate at time t in seconds
    bool contains(double t) const;

private:
    TimeWindow window_;
};

} // namespace compiler
} // namespace vcomp
