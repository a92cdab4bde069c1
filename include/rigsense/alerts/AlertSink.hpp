#pragma once

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

#include "rigsense/alerts/Alert.hpp"

namespace rigsense {

// Delivery endpoint for published alerts. deliver() throws on failure;
// the publisher keeps the alert for redelivery.
class AlertSink {
public:
    virtual ~AlertSink() = default;

    virtual const char* name() const = 0;
    virtual void deliver(const Alert& alert) = 0;
};

// Tagged console line per alert.
class LogAlertSink : public AlertSink {
public:
    const char* name() const override { return "log"; }
    void deliver(const Alert& alert) override;
};

// Appends one JSON object per line. The file is the persistent alert history.
class JournalAlertSink : public AlertSink {
public:
    explicit JournalAlertSink(std::string path);

    const char* name() const override { return "journal"; }
    void deliver(const Alert& alert) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::mutex mtx_;
};

// POSTs the alert JSON to an HTTP endpoint. When a secret is configured
// the body is signed: X-Rigsense-Signature: hex(HMAC-SHA256(secret, body)).
class WebhookAlertSink : public AlertSink {
public:
    WebhookAlertSink(
        std::string url,
        std::string secret,
        long timeout_sec = 3
    );

    const char* name() const override { return "webhook"; }
    void deliver(const Alert& alert) override;

    std::string sign(const std::string& payload) const;

private:
    std::string url_;
    std::string secret_;
    long timeout_sec_;
};

} // namespace rigsense
