#include "rigsense/alerts/AlertJson.hpp"

#include <stdexcept>

namespace json = boost::json;

namespace rigsense {
namespace alert_json {

namespace {

uint64_t asUnsigned(const json::value& v, const char* field) {
    if (v.is_uint64()) return v.as_uint64();
    if (v.is_int64() && v.as_int64() >= 0) return static_cast<uint64_t>(v.as_int64());
    throw std::invalid_argument(std::string("field ") + field + " must be a non-negative integer");
}

std::string asString(const json::value& v, const char* field) {
    if (!v.is_string()) {
        throw std::invalid_argument(std::string("field ") + field + " must be a string");
    }
    return std::string(v.as_string().c_str());
}

} // namespace

json::object toJson(const Alert& a) {
    json::object o;
    o["id"] = a.id;
    o["category"] = toString(a.category);
    o["severity"] = toString(a.severity);
    o["state"] = toString(a.state);
    o["vote"] = a.vote;
    o["cycle"] = a.cycle;
    o["window_sequence"] = a.window_sequence;
    o["window_ts_ms"] = a.window_ts_ms;
    o["issue"] = a.issue;
    o["message"] = a.message;
    o["recommendation"] = a.recommendation;
    o["refresh_count"] = a.refresh_count;
    o["raised_ms"] = a.raised_ms;
    o["updated_ms"] = a.updated_ms;

    json::array agents;
    for (const auto& s : a.supporting_agents) agents.emplace_back(s);
    o["supporting_agents"] = std::move(agents);

    json::array contributions;
    for (const auto& c : a.contributions) {
        json::object co;
        co["agent"] = c.agent;
        co["cycle"] = c.cycle;
        co["age_cycles"] = c.age_cycles;
        co["score"] = c.score;
        co["confidence"] = c.confidence;
        co["weight"] = c.weight;
        co["model_version"] = c.model_version;
        co["supporting"] = c.supporting;
        contributions.emplace_back(std::move(co));
    }
    o["contributions"] = std::move(contributions);

    json::array factors;
    for (const auto& f : a.factors) {
        json::object fo;
        fo["name"] = f.name;
        fo["value"] = f.value;
        fo["unit"] = f.unit;
        factors.emplace_back(std::move(fo));
    }
    o["factors"] = std::move(factors);
    return o;
}

json::object toJson(const FeedbackEvent& e) {
    json::object o;
    o["event_id"] = e.event_id;
    o["alert_id"] = e.alert_id;
    o["kind"] = toString(e.kind);
    o["category"] = toString(e.category);
    o["source"] = e.source;
    o["ts_ms"] = e.ts_ms;
    return o;
}

json::object toJson(const HealthFlags& h) {
    json::object o;
    json::object degraded;
    for (Category c : kAllCategories) {
        degraded[toString(c)] = h.degradedFor(c);
    }
    o["degraded"] = std::move(degraded);
    o["global_degraded"] = h.global_degraded;

    json::array diverged;
    for (const auto& a : h.diverged_agents) diverged.emplace_back(a);
    o["model_divergence"] = std::move(diverged);
    return o;
}

FeedbackEvent feedbackFromJson(const json::value& v) {
    if (!v.is_object()) {
        throw std::invalid_argument("feedback must be a JSON object");
    }
    const json::object& o = v.as_object();

    FeedbackEvent e;

    const json::value* id = o.if_contains("event_id");
    if (!id) throw std::invalid_argument("missing event_id");
    e.event_id = asString(*id, "event_id");
    if (e.event_id.empty()) throw std::invalid_argument("empty event_id");

    const json::value* kind = o.if_contains("kind");
    if (!kind) throw std::invalid_argument("missing kind");
    if (!parseFeedbackKind(asString(*kind, "kind"), e.kind)) {
        throw std::invalid_argument("unknown kind " + asString(*kind, "kind"));
    }

    if (const json::value* alert = o.if_contains("alert_id")) {
        e.alert_id = asUnsigned(*alert, "alert_id");
    }

    const json::value* category = o.if_contains("category");
    if (category) {
        if (!parseCategory(asString(*category, "category"), e.category)) {
            throw std::invalid_argument("unknown category " + asString(*category, "category"));
        }
    }

    if (e.kind == FeedbackKind::Missed) {
        if (!category) throw std::invalid_argument("missed feedback requires category");
    } else if (e.alert_id == 0) {
        throw std::invalid_argument("feedback requires alert_id");
    }

    if (const json::value* source = o.if_contains("source")) {
        e.source = asString(*source, "source");
    }
    if (const json::value* ts = o.if_contains("ts_ms")) {
        e.ts_ms = asUnsigned(*ts, "ts_ms");
    }
    return e;
}

FeedbackEvent parseFeedback(const std::string& body) {
    json::error_code ec;
    json::value v = json::parse(body, ec);
    if (ec) {
        throw std::invalid_argument("feedback is not valid JSON: " + ec.message());
    }
    return feedbackFromJson(v);
}

std::string serialize(const Alert& a) {
    return json::serialize(toJson(a));
}

} // namespace alert_json
} // namespace rigsense
