#pragma once

#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <vector>

namespace rigsense {

enum class Channel : uint8_t {
    Depth = 0,
    Wob,
    Rpm,
    Torque,
    Spp,
    FlowIn,
    FlowOut,
    MudDensity,
    Ecd,
    Rop,
    HookLoad
};

constexpr size_t kChannelCount = 11;

const char* toString(Channel c);

constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();

// One normalised rig sample. Missing readings are NaN.
struct TelemetrySample {
    uint64_t ts_ms = 0;
    double depth_ft = kMissing;
    double wob_klbs = kMissing;
    double rpm = kMissing;
    double torque_kftlbs = kMissing;
    double spp_psi = kMissing;
    double flow_in_gpm = kMissing;
    double flow_out_gpm = kMissing;
    double mud_density_ppg = kMissing;
    double ecd_ppg = kMissing;
    double rop_fthr = kMissing;
    double hook_load_klbs = kMissing;

    double value(Channel c) const;
    bool has(Channel c) const { return std::isfinite(value(c)); }
};

// Immutable once constructed. Shared with agents as pointer-to-const.
// Valid sequences start at 1.
class TelemetryWindow {
public:
    TelemetryWindow(
        uint64_t sequence,
        uint64_t start_ms,
        uint64_t end_ms,
        std::vector<TelemetrySample> samples
    );

    uint64_t sequence() const { return sequence_; }
    uint64_t startMs() const { return start_ms_; }
    uint64_t endMs() const { return end_ms_; }
    uint64_t durationMs() const { return end_ms_ - start_ms_; }

    const std::vector<TelemetrySample>& samples() const { return samples_; }
    bool empty() const { return samples_.empty(); }
    size_t size() const { return samples_.size(); }

    // Most recent sample. Undefined on an empty window.
    const TelemetrySample& latest() const { return samples_.back(); }

    // Samples ordered by non-decreasing timestamp.
    bool ordered() const;

private:
    uint64_t sequence_;
    uint64_t start_ms_;
    uint64_t end_ms_;
    std::vector<TelemetrySample> samples_;
};

using WindowPtr = std::shared_ptr<const TelemetryWindow>;

} // namespace rigsense
