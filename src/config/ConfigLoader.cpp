#include "rigsense/config/ConfigLoader.hpp"
#include "rigsense/agents/DefaultAgents.hpp"
#include "rigsense/core/Errors.hpp"

#include <boost/json.hpp>

#include <cmath>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <string>
#include <utility>

namespace json = boost::json;

namespace rigsense {

namespace {

// Typed view of one JSON object. A missing key yields the default; a key
// of the wrong type is a ConfigError naming "<section>.<key>".
class Section {
public:
    Section(const json::object* obj, std::string name)
        : obj_(obj), name_(std::move(name)) {}

    bool present() const { return obj_ != nullptr; }

    Section child(const char* key) const {
        const json::value* v = find(key);
        if (!v) return Section(nullptr, path(key));
        if (!v->is_object()) fail(key, "an object");
        return Section(&v->as_object(), path(key));
    }

    double getDouble(const char* key, double def) const {
        const json::value* v = find(key);
        if (!v) return def;
        if (v->is_double()) return v->as_double();
        if (v->is_int64()) return static_cast<double>(v->as_int64());
        if (v->is_uint64()) return static_cast<double>(v->as_uint64());
        fail(key, "a number");
        return def;
    }

    uint64_t getUint(const char* key, uint64_t def) const {
        const json::value* v = find(key);
        if (!v) return def;
        if (v->is_uint64()) return v->as_uint64();
        if (v->is_int64() && v->as_int64() >= 0) return static_cast<uint64_t>(v->as_int64());
        fail(key, "a non-negative integer");
        return def;
    }

    bool getBool(const char* key, bool def) const {
        const json::value* v = find(key);
        if (!v) return def;
        if (!v->is_bool()) fail(key, "a boolean");
        return v->as_bool();
    }

    std::string getString(const char* key, const std::string& def) const {
        const json::value* v = find(key);
        if (!v) return def;
        if (!v->is_string()) fail(key, "a string");
        return std::string(v->as_string().c_str());
    }

    const json::object* object() const { return obj_; }
    const std::string& name() const { return name_; }

    [[noreturn]] void fail(const char* key, const char* expected) const {
        throw ConfigError(path(key) + " must be " + expected);
    }

private:
    const json::value* find(const char* key) const {
        return obj_ ? obj_->if_contains(key) : nullptr;
    }

    std::string path(const char* key) const {
        return name_.empty() ? std::string(key) : name_ + "." + key;
    }

    const json::object* obj_;
    std::string name_;
};

void readAgents(const Section& agents, EngineConfig& cfg) {
    if (!agents.present()) return;

    for (const auto& kv : *agents.object()) {
        std::string name(kv.key());
        auto it = cfg.agents.find(name);
        if (it == cfg.agents.end()) {
            throw ConfigError("agents." + name + ": unknown agent");
        }
        if (!kv.value().is_object()) {
            throw ConfigError("agents." + name + " must be an object");
        }

        Section s(&kv.value().as_object(), "agents." + name);
        AgentSettings& a = it->second;
        a.enabled = s.getBool("enabled", a.enabled);
        a.sensitivity = s.getDouble("sensitivity", a.sensitivity);
        a.adaptation.step = s.getDouble("adaptation_step", a.adaptation.step);
        a.adaptation.divergence_trip = static_cast<uint32_t>(
            s.getUint("divergence_trip", a.adaptation.divergence_trip));

        if (name == agent_names::kRopOptimization) {
            cfg.rop.aggressiveness = s.getDouble("aggressiveness", cfg.rop.aggressiveness);
            cfg.rop.ucs_psi = s.getDouble("ucs_psi", cfg.rop.ucs_psi);
            cfg.rop.max_torque_kftlbs = s.getDouble("max_torque_kftlbs", cfg.rop.max_torque_kftlbs);
        }
    }
}

void readPhysics(const Section& s, PhysicsLimits& p) {
    p.max_mass_gain = s.getDouble("max_mass_gain", p.max_mass_gain);
    p.max_hydraulic_residual = s.getDouble("max_hydraulic_residual", p.max_hydraulic_residual);
    p.max_mse_psi = s.getDouble("max_mse_psi", p.max_mse_psi);
    p.max_setpoint_change = s.getDouble("max_setpoint_change", p.max_setpoint_change);
    p.max_rop_fthr = s.getDouble("max_rop_fthr", p.max_rop_fthr);
    p.min_sensitivity = s.getDouble("min_sensitivity", p.min_sensitivity);
    p.max_sensitivity = s.getDouble("max_sensitivity", p.max_sensitivity);
    p.min_reliability = s.getDouble("min_reliability", p.min_reliability);
    p.max_reliability = s.getDouble("max_reliability", p.max_reliability);
    p.max_abs_bias = s.getDouble("max_abs_bias", p.max_abs_bias);
    p.max_weight = s.getDouble("max_weight", p.max_weight);
    p.min_weight_sum = s.getDouble("min_weight_sum", p.min_weight_sum);
    p.max_weight_sum = s.getDouble("max_weight_sum", p.max_weight_sum);
    p.max_step = s.getDouble("max_step", p.max_step);
}

bool unit(double v) {
    return std::isfinite(v) && v >= 0.0 && v <= 1.0;
}

} // namespace

EngineConfig ConfigLoader::loadFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("cannot open config " + path);
    }
    std::string data(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>()
    );
    std::cout << "[CONFIG] loading " << path << "\n";
    return parse(data);
}

EngineConfig ConfigLoader::parse(const std::string& text) {
    json::error_code ec;
    json::value doc = json::parse(text, ec);
    if (ec) {
        throw ConfigError("config is not valid JSON: " + ec.message());
    }
    if (!doc.is_object()) {
        throw ConfigError("config root must be an object");
    }

    EngineConfig cfg = EngineConfig::defaults();
    Section root(&doc.as_object(), "");

    cfg.well_id = root.getString("well_id", cfg.well_id);
    cfg.state_path = root.getString("state_path", cfg.state_path);

    Section cycle = root.child("cycle");
    cfg.cycle_interval_ms = cycle.getUint("interval_ms", cfg.cycle_interval_ms);
    cfg.cycle_deadline_ms = cycle.getUint("deadline_ms", cfg.cycle_deadline_ms);
    cfg.worker_threads = static_cast<size_t>(cycle.getUint("workers", cfg.worker_threads));

    Section consensus = root.child("consensus");
    Section thresholds = consensus.child("thresholds");
    if (thresholds.present()) {
        for (const auto& kv : *thresholds.object()) {
            Category c;
            std::string key(kv.key());
            if (!parseCategory(key, c)) {
                throw ConfigError("consensus.thresholds." + key + ": unknown category");
            }
            cfg.consensus.setThreshold(c, thresholds.getDouble(key.c_str(), 0.0));
        }
    }
    cfg.consensus.corroboration_window_cycles = static_cast<uint32_t>(consensus.getUint(
        "corroboration_window_cycles", cfg.consensus.corroboration_window_cycles));
    cfg.consensus.recency_decay = consensus.getDouble("recency_decay", cfg.consensus.recency_decay);
    cfg.consensus.min_signals = static_cast<uint32_t>(
        consensus.getUint("min_signals", cfg.consensus.min_signals));

    readAgents(root.child("agents"), cfg);
    readPhysics(root.child("physics"), cfg.physics);

    Section alerts = root.child("alerts");
    cfg.alerts.expiry_ms = alerts.getUint("expiry_ms", cfg.alerts.expiry_ms);
    cfg.alerts.history_limit = static_cast<size_t>(
        alerts.getUint("history_limit", cfg.alerts.history_limit));
    cfg.publisher.max_attempts = static_cast<uint32_t>(
        alerts.getUint("max_delivery_attempts", cfg.publisher.max_attempts));
    cfg.publisher.retry_interval_ms = alerts.getUint("retry_interval_ms", cfg.publisher.retry_interval_ms);
    cfg.sinks.log = alerts.getBool("log", cfg.sinks.log);
    cfg.sinks.journal_path = alerts.getString("journal_path", cfg.sinks.journal_path);
    cfg.sinks.webhook_url = alerts.getString("webhook_url", cfg.sinks.webhook_url);
    cfg.sinks.webhook_secret = alerts.getString("webhook_secret", cfg.sinks.webhook_secret);
    cfg.sinks.webhook_timeout_sec = static_cast<long>(
        alerts.getUint("webhook_timeout_sec", static_cast<uint64_t>(cfg.sinks.webhook_timeout_sec)));

    Section http = root.child("http");
    cfg.http.enabled = http.getBool("enabled", cfg.http.enabled);
    cfg.http.address = http.getString("address", cfg.http.address);
    uint64_t port = http.getUint("port", cfg.http.port);
    if (port == 0 || port > std::numeric_limits<uint16_t>::max()) {
        throw ConfigError("http.port out of range");
    }
    cfg.http.port = static_cast<uint16_t>(port);

    Section sim = root.child("simulation");
    cfg.simulation.enabled = sim.getBool("enabled", cfg.simulation.enabled);
    cfg.simulation.seed = static_cast<uint32_t>(sim.getUint("seed", cfg.simulation.seed));
    cfg.simulation.samples_per_window = static_cast<uint32_t>(
        sim.getUint("samples_per_window", cfg.simulation.samples_per_window));
    // Windows follow the cycle cadence unless told otherwise.
    cfg.simulation.window_ms = sim.getUint("window_ms", cfg.cycle_interval_ms);
    cfg.simulation.max_windows = sim.getUint("max_windows", cfg.simulation.max_windows);
    cfg.simulation.scenario_start_window = sim.getUint(
        "scenario_start_window", cfg.simulation.scenario_start_window);
    std::string scenario = sim.getString("scenario", toString(cfg.simulation.scenario));
    if (!parseScenario(scenario, cfg.simulation.scenario)) {
        throw ConfigError("simulation.scenario: unknown scenario " + scenario);
    }

    validate(cfg);
    return cfg;
}

void ConfigLoader::validate(const EngineConfig& cfg) {
    if (cfg.well_id.empty()) {
        throw ConfigError("well_id must not be empty");
    }
    if (cfg.cycle_interval_ms == 0) {
        throw ConfigError("cycle.interval_ms must be positive");
    }
    if (cfg.cycle_deadline_ms == 0 || cfg.cycle_deadline_ms > cfg.cycle_interval_ms) {
        throw ConfigError("cycle.deadline_ms must be in (0, interval_ms]");
    }
    if (cfg.worker_threads == 0) {
        throw ConfigError("cycle.workers must be positive");
    }

    for (Category c : kAllCategories) {
        if (!unit(cfg.consensus.threshold(c))) {
            throw ConfigError(std::string("consensus.thresholds.") + toString(c) +
                              " must be in [0,1]");
        }
    }
    if (cfg.consensus.corroboration_window_cycles == 0) {
        throw ConfigError("consensus.corroboration_window_cycles must be positive");
    }
    if (!(cfg.consensus.recency_decay > 0.0 && cfg.consensus.recency_decay <= 1.0)) {
        throw ConfigError("consensus.recency_decay must be in (0,1]");
    }
    if (cfg.consensus.min_signals == 0) {
        throw ConfigError("consensus.min_signals must be positive");
    }

    bool any = false;
    for (const auto& kv : cfg.agents) {
        const AgentSettings& a = kv.second;
        if (!unit(a.sensitivity)) {
            throw ConfigError("agents." + kv.first + ".sensitivity must be in [0,1]");
        }
        if (!(a.adaptation.step > 0.0 && a.adaptation.step <= cfg.physics.max_step)) {
            throw ConfigError("agents." + kv.first + ".adaptation_step must be in (0, physics.max_step]");
        }
        if (a.adaptation.divergence_trip == 0) {
            throw ConfigError("agents." + kv.first + ".divergence_trip must be positive");
        }
        any |= a.enabled;
    }
    if (!any) {
        throw ConfigError("no agent enabled");
    }
    if (!unit(cfg.rop.aggressiveness)) {
        throw ConfigError("agents.rop_optimization.aggressiveness must be in [0,1]");
    }
    if (!(cfg.rop.ucs_psi > 0.0)) {
        throw ConfigError("agents.rop_optimization.ucs_psi must be positive");
    }

    const PhysicsLimits& p = cfg.physics;
    if (p.min_sensitivity > p.max_sensitivity ||
        p.min_reliability > p.max_reliability ||
        p.min_weight_sum > p.max_weight_sum ||
        !(p.max_step > 0.0)) {
        throw ConfigError("physics limits inconsistent");
    }

    // Every enabled agent must start inside the physics limits.
    ConstraintChecker checker(p);
    for (const auto& kv : cfg.agents) {
        if (!kv.second.enabled) continue;
        AgentModelState start;
        if (!defaultStateFor(kv.first, kv.second.sensitivity, start)) continue;
        ConstraintVerdict v = checker.checkBounds(start);
        if (!v) {
            throw ConfigError("agents." + kv.first + " starts outside physics limits: " + v.reason);
        }
    }

    if (cfg.alerts.history_limit == 0) {
        throw ConfigError("alerts.history_limit must be positive");
    }
    if (cfg.publisher.max_attempts == 0) {
        throw ConfigError("alerts.max_delivery_attempts must be positive");
    }
    if (cfg.publisher.retry_interval_ms == 0) {
        throw ConfigError("alerts.retry_interval_ms must be positive");
    }
    if (cfg.simulation.samples_per_window == 0 || cfg.simulation.window_ms == 0) {
        throw ConfigError("simulation window must have samples and a duration");
    }
}

void ConfigLoader::dump(const EngineConfig& cfg) {
    std::cout << "[CONFIG] well=" << cfg.well_id
              << " interval=" << cfg.cycle_interval_ms << "ms"
              << " deadline=" << cfg.cycle_deadline_ms << "ms"
              << " workers=" << cfg.worker_threads << "\n";
    for (Category c : kAllCategories) {
        std::cout << "[CONFIG]   threshold " << toString(c)
                  << " = " << cfg.consensus.threshold(c) << "\n";
    }
    std::cout << "[CONFIG]   corroboration window=" << cfg.consensus.corroboration_window_cycles
              << " decay=" << cfg.consensus.recency_decay << "\n";
    for (const auto& kv : cfg.agents) {
        std::cout << "[CONFIG]   agent " << kv.first
                  << (kv.second.enabled ? " on" : " off")
                  << " sensitivity=" << kv.second.sensitivity
                  << " step=" << kv.second.adaptation.step
                  << " trip=" << kv.second.adaptation.divergence_trip << "\n";
    }
    std::cout << "[CONFIG]   journal=" << (cfg.sinks.journal_path.empty() ? "-" : cfg.sinks.journal_path)
              << " webhook=" << (cfg.sinks.webhook_url.empty() ? "-" : cfg.sinks.webhook_url)
              << " secret=" << (cfg.sinks.webhook_secret.empty() ? "-" : "********") << "\n";
    std::cout << "[CONFIG]   http=" << (cfg.http.enabled ? cfg.http.address + ":" + std::to_string(cfg.http.port) : "off")
              << " state=" << (cfg.state_path.empty() ? "-" : cfg.state_path)
              << " simulation=" << (cfg.simulation.enabled ? toString(cfg.simulation.scenario) : "off")
              << "\n";
}

} // namespace rigsense
