#include "rigsense/net/HttpServer.hpp"
#include "rigsense/alerts/AlertJson.hpp"
#include "rigsense/core/Clock.hpp"

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/json.hpp>

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
namespace json  = boost::json;
using tcp = asio::ip::tcp;

namespace rigsense {

namespace {

HttpResponse error(unsigned status, const std::string& message) {
    json::object o;
    o["error"] = message;
    return HttpResponse{status, "application/json", json::serialize(o)};
}

} // namespace

HttpServer::HttpServer(
    std::string address,
    uint16_t port,
    DetectionEngine& engine
) : address_(std::move(address)),
    port_(port),
    engine_(engine) {}

HttpResponse HttpServer::handle(
    const std::string& method,
    const std::string& target,
    const std::string& body
) {
    if (method == "GET") {
        if (target == "/alerts") return alerts();
        if (target == "/status") {
            return HttpResponse{200, "application/json", engine_.status().to_json()};
        }
        if (target == "/metrics") {
            return HttpResponse{200, "text/plain", engine_.status().to_prometheus()};
        }
    } else if (method == "POST") {
        if (target == "/feedback") return feedback(body);
        if (target == "/recalibrate") return recalibrate(body);
    }
    return error(404, "no route for " + method + " " + target);
}

HttpResponse HttpServer::alerts() {
    json::array active;
    for (const auto& a : engine_.alerts().active()) {
        active.emplace_back(alert_json::toJson(a));
    }
    json::array history;
    for (const auto& a : engine_.alerts().history()) {
        history.emplace_back(alert_json::toJson(a));
    }

    json::object root;
    root["active"] = std::move(active);
    root["history"] = std::move(history);
    root["health"] = alert_json::toJson(engine_.publisher().health());
    return HttpResponse{200, "application/json", json::serialize(root)};
}

HttpResponse HttpServer::feedback(const std::string& body) {
    FeedbackEvent e;
    try {
        e = alert_json::parseFeedback(body);
    } catch (const std::invalid_argument& ex) {
        return error(400, ex.what());
    }
    if (e.ts_ms == 0) e.ts_ms = infra::wall_ms();
    if (e.source.empty()) e.source = "http";

    engine_.publisher().submitFeedback(e);

    json::object o;
    o["queued"] = true;
    o["event_id"] = e.event_id;
    return HttpResponse{202, "application/json", json::serialize(o)};
}

HttpResponse HttpServer::recalibrate(const std::string& body) {
    json::error_code ec;
    json::value v = json::parse(body, ec);
    if (ec || !v.is_object()) return error(400, "body must be a JSON object");

    const json::object& o = v.as_object();
    const json::value* agent = o.if_contains("agent");
    if (!agent || !agent->is_string()) return error(400, "missing agent");

    bool reset = false;
    if (const json::value* r = o.if_contains("reset")) {
        if (!r->is_bool()) return error(400, "reset must be a boolean");
        reset = r->as_bool();
    }

    std::string name(agent->as_string().c_str());
    if (!engine_.adaptation().acknowledgeRecalibration(name, reset)) {
        return error(404, "unknown agent " + name);
    }

    json::object out;
    out["agent"] = name;
    out["reset"] = reset;
    out["version"] = engine_.agents().find(name)->modelState()->version;
    return HttpResponse{200, "application/json", json::serialize(out)};
}

void HttpServer::run(const std::atomic<bool>& running) {
    try {
        asio::io_context ioc;
        tcp::endpoint endpoint(asio::ip::make_address(address_), port_);
        tcp::acceptor acceptor(ioc, endpoint);
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        acceptor.non_blocking(true);

        std::cout << "[HTTP] Listening on " << address_ << ":" << port_ << "\n";

        while (running.load()) {
            tcp::socket socket(ioc);
            beast::error_code ec;
            acceptor.accept(socket, ec);

            if (ec == asio::error::would_block) {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                continue;
            }
            if (ec) continue;

            try {
                socket.non_blocking(false);
                beast::flat_buffer buffer;
                http::request<http::string_body> req;
                http::read(socket, buffer, req);

                HttpResponse out = handle(
                    std::string(req.method_string()),
                    std::string(req.target()),
                    req.body());

                http::response<http::string_body> res;
                res.version(req.version());
                res.result(static_cast<http::status>(out.status));
                res.set(http::field::server, "rigsense");
                res.set(http::field::content_type, out.content_type);
                res.body() = std::move(out.body);
                res.keep_alive(false);
                res.prepare_payload();
                http::write(socket, res);
            } catch (const std::exception& e) {
                std::cerr << "[HTTP] request dropped: " << e.what() << "\n";
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[HTTP] " << e.what() << "\n";
    }
    std::cout << "[HTTP] stopped\n";
}

} // namespace rigsense
