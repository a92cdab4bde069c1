#include "rigsense/persistence/ModelStatePersistence.hpp"
#include "rigsense/core/Clock.hpp"

#include <boost/json.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <utility>

namespace json = boost::json;

namespace rigsense {

namespace {

double number(const json::value& v) {
    if (v.is_double()) return v.as_double();
    if (v.is_int64()) return static_cast<double>(v.as_int64());
    if (v.is_uint64()) return static_cast<double>(v.as_uint64());
    throw std::runtime_error("expected a number");
}

AgentModelState readState(const std::string& name, const json::object& o) {
    AgentModelState s;
    s.agent = name;
    s.version = static_cast<uint64_t>(number(o.at("version")));
    s.sensitivity = number(o.at("sensitivity"));
    s.reliability = number(o.at("reliability"));
    s.bias = number(o.at("bias"));
    for (const auto& w : o.at("weights").as_array()) {
        s.weights.push_back(number(w));
    }
    return s;
}

} // namespace

ModelStatePersistence::ModelStatePersistence(
    std::string path,
    std::string well_id
) : path_(std::move(path)),
    well_id_(std::move(well_id)) {}

void ModelStatePersistence::save(const AgentRegistry& registry) const {
    json::object root;
    root["well_id"] = well_id_;
    root["saved_ms"] = infra::wall_ms();

    json::object agents;
    for (const auto& a : registry.all()) {
        ModelSnapshot s = a->modelState();

        json::object o;
        o["version"] = s->version;
        o["sensitivity"] = s->sensitivity;
        o["reliability"] = s->reliability;
        o["bias"] = s->bias;

        json::array weights;
        for (double w : s->weights) weights.emplace_back(w);
        o["weights"] = std::move(weights);

        agents[a->name()] = std::move(o);
    }
    root["agents"] = std::move(agents);

    std::ofstream out(path_);
    if (!out.is_open()) {
        throw std::runtime_error("cannot write model state " + path_);
    }
    out << json::serialize(root);
    std::cout << "[STATE] saved " << registry.size() << " model states to " << path_ << "\n";
}

size_t ModelStatePersistence::load(
    AgentRegistry& registry,
    const ConstraintChecker& checker
) const {
    std::ifstream in(path_);
    if (!in.is_open()) {
        std::cout << "[STATE] no saved state at " << path_ << ", starting from defaults\n";
        return 0;
    }

    std::string data(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>()
    );

    json::error_code ec;
    json::value doc = json::parse(data, ec);
    if (ec || !doc.is_object()) {
        throw std::runtime_error("model state " + path_ + " is not a JSON object");
    }
    const json::object& root = doc.as_object();

    const json::value* well = root.if_contains("well_id");
    if (!well || !well->is_string() || well->as_string() != well_id_.c_str()) {
        std::cout << "[STATE] saved state belongs to another well, ignored\n";
        return 0;
    }

    const json::value* agents = root.if_contains("agents");
    if (!agents || !agents->is_object()) {
        throw std::runtime_error("model state " + path_ + " has no agents");
    }

    size_t installed = 0;
    for (const auto& kv : agents->as_object()) {
        std::string name(kv.key());
        AgentAdapter* agent = registry.find(name);
        if (!agent) {
            std::cout << "[STATE] " << name << " not registered, skipped\n";
            continue;
        }

        AgentModelState s;
        try {
            s = readState(name, kv.value().as_object());
        } catch (const std::exception& e) {
            std::cerr << "[STATE] " << name << " malformed: " << e.what() << "\n";
            continue;
        }

        if (s.weights.size() != agent->defaults().weights.size()) {
            std::cerr << "[STATE] " << name << " weight count mismatch, skipped\n";
            continue;
        }
        ConstraintVerdict v = checker.checkBounds(s);
        if (!v) {
            std::cerr << "[STATE] " << name << " out of bounds (" << v.reason << "), skipped\n";
            continue;
        }

        agent->install(std::make_shared<const AgentModelState>(std::move(s)));
        installed++;
    }

    std::cout << "[STATE] restored " << installed << " model states for " << well_id_ << "\n";
    return installed;
}

} // namespace rigsense
