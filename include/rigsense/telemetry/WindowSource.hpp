#pragma once

#include "rigsense/telemetry/TelemetryWindow.hpp"

namespace rigsense {

// Where windows come from. The normalizer in front of it is not ours.
// Sequence numbers start at 1 and never decrease; 0 means "no window" and
// the engine skips such a window.
class WindowSource {
public:
    virtual ~WindowSource() = default;

    // Next window, or nullptr when the source is exhausted.
    virtual WindowPtr next() = 0;
};

} // namespace rigsense
