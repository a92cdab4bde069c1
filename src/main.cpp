#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <thread>

#include <curl/curl.h>

#include "rigsense/agents/DefaultAgents.hpp"
#include "rigsense/alerts/AlertSink.hpp"
#include "rigsense/config/ConfigLoader.hpp"
#include "rigsense/core/Errors.hpp"
#include "rigsense/engine/DetectionEngine.hpp"
#include "rigsense/net/HttpServer.hpp"
#include "rigsense/persistence/ModelStatePersistence.hpp"
#include "rigsense/telemetry/SimulatedFeed.hpp"

using namespace rigsense;

static std::atomic<bool> g_running{true};
static void on_signal(int){ g_running.store(false); }

static void attachSinks(const EngineConfig& cfg, AlertPublisher& publisher) {
    if (cfg.sinks.log) {
        publisher.addSink(std::make_unique<LogAlertSink>());
    }
    if (!cfg.sinks.journal_path.empty()) {
        publisher.addSink(std::make_unique<JournalAlertSink>(cfg.sinks.journal_path));
    }
    if (!cfg.sinks.webhook_url.empty()) {
        publisher.addSink(std::make_unique<WebhookAlertSink>(
            cfg.sinks.webhook_url,
            cfg.sinks.webhook_secret,
            cfg.sinks.webhook_timeout_sec));
    }
}

int main(int argc, char** argv) {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    EngineConfig cfg;
    try {
        cfg = argc > 1 ? ConfigLoader::loadFile(argv[1]) : EngineConfig::defaults();
        ConfigLoader::validate(cfg);
    } catch (const ConfigError& e) {
        std::cerr << "[CONFIG] " << e.what() << "\n";
        return 1;
    }
    ConfigLoader::dump(cfg);

    curl_global_init(CURL_GLOBAL_DEFAULT);
    int rc = 0;

    try {
        DetectionEngine engine(cfg, buildAgents(cfg));
        attachSinks(cfg, engine.publisher());

        std::unique_ptr<ModelStatePersistence> persistence;
        if (!cfg.state_path.empty()) {
            persistence = std::make_unique<ModelStatePersistence>(cfg.state_path, cfg.well_id);
            try {
                persistence->load(engine.agents(), engine.checker());
            } catch (const std::runtime_error& e) {
                std::cerr << "[STATE] ignoring stored state: " << e.what() << "\n";
            }
        }

        std::thread http_thread;
        std::unique_ptr<HttpServer> http;
        if (cfg.http.enabled) {
            http = std::make_unique<HttpServer>(cfg.http.address, cfg.http.port, engine);
            http_thread = std::thread([&http] { http->run(g_running); });
        }

        std::cout << "[RIGSENSE] well " << cfg.well_id << " running with "
                  << engine.agents().size() << " agents\n";

        if (cfg.simulation.enabled) {
            SimulatedFeed feed(cfg.simulation);
            engine.run(feed, g_running);
        } else {
            while (g_running.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        }

        g_running.store(false);
        if (http_thread.joinable()) http_thread.join();
        engine.publisher().stop();

        if (persistence) {
            try {
                persistence->save(engine.agents());
            } catch (const std::runtime_error& e) {
                std::cerr << "[STATE] save failed: " << e.what() << "\n";
                rc = 1;
            }
        }

        std::cout << engine.status().to_prometheus();
    } catch (const std::exception& e) {
        std::cerr << "[RIGSENSE] fatal: " << e.what() << "\n";
        rc = 1;
    }

    curl_global_cleanup();
    std::cout << "[RIGSENSE] shutdown\n";
    return rc;
}
