#include "rigsense/telemetry/TelemetryWindow.hpp"

#include <utility>

namespace rigsense {

const char* toString(Channel c) {
    switch (c) {
        case Channel::Depth:      return "depth";
        case Channel::Wob:        return "wob";
        case Channel::Rpm:        return "rpm";
        case Channel::Torque:     return "torque";
        case Channel::Spp:        return "spp";
        case Channel::FlowIn:     return "flow_in";
        case Channel::FlowOut:    return "flow_out";
        case Channel::MudDensity: return "mud_density";
        case Channel::Ecd:        return "ecd";
        case Channel::Rop:        return "rop";
        case Channel::HookLoad:   return "hook_load";
    }
    return "unknown";
}

double TelemetrySample::value(Channel c) const {
    switch (c) {
        case Channel::Depth:      return depth_ft;
        case Channel::Wob:        return wob_klbs;
        case Channel::Rpm:        return rpm;
        case Channel::Torque:     return torque_kftlbs;
        case Channel::Spp:        return spp_psi;
        case Channel::FlowIn:     return flow_in_gpm;
        case Channel::FlowOut:    return flow_out_gpm;
        case Channel::MudDensity: return mud_density_ppg;
        case Channel::Ecd:
            // ECD falls back to static mud density when not reported.
            return std::isfinite(ecd_ppg) ? ecd_ppg : mud_density_ppg;
        case Channel::Rop:        return rop_fthr;
        case Channel::HookLoad:   return hook_load_klbs;
    }
    return kMissing;
}

TelemetryWindow::TelemetryWindow(
    uint64_t sequence,
    uint64_t start_ms,
    uint64_t end_ms,
    std::vector<TelemetrySample> samples
) : sequence_(sequence),
    start_ms_(start_ms),
    end_ms_(end_ms < start_ms ? start_ms : end_ms),
    samples_(std::move(samples)) {}

bool TelemetryWindow::ordered() const {
    for (size_t i = 1; i < samples_.size(); ++i) {
        if (samples_[i].ts_ms < samples_[i - 1].ts_ms) return false;
    }
    return true;
}

} // namespace rigsense
