#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include "rigsense/engine/DetectionEngine.hpp"

namespace rigsense {

struct HttpResponse {
    unsigned status = 200;
    std::string content_type = "application/json";
    std::string body;
};

// ---------------------------------------------------------------------------
// Status surface.
//   GET  /alerts       pending alerts and bounded history
//   GET  /status       counters and health flags (JSON)
//   GET  /metrics      Prometheus text
//   POST /feedback     FeedbackEvent JSON, queued for the adaptation path
//   POST /recalibrate  {"agent": "...", "reset": bool} after a divergence
// ---------------------------------------------------------------------------
class HttpServer {
public:
    HttpServer(
        std::string address,
        uint16_t port,
        DetectionEngine& engine
    );

    // Blocks until `running` drops.
    void run(const std::atomic<bool>& running);

    // Routing without the socket; run() calls it per request.
    HttpResponse handle(
        const std::string& method,
        const std::string& target,
        const std::string& body
    );

private:
    HttpResponse alerts();
    HttpResponse feedback(const std::string& body);
    HttpResponse recalibrate(const std::string& body);

    std::string address_;
    uint16_t port_;
    DetectionEngine& engine_;
};

} // namespace rigsense
