// =============================================================================
// src/alerts_test.cpp - Alert book, publisher and feedback codec tests
// =============================================================================

#include <chrono>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/json.hpp>

#include "rigsense/alerts/AlertBook.hpp"
#include "rigsense/alerts/AlertJson.hpp"
#include "rigsense/alerts/AlertPublisher.hpp"
#include "rigsense/alerts/AlertSink.hpp"
#include "testing/GateSink.hpp"

using namespace rigsense;
using rigsense::testing::GateSink;
namespace json = boost::json;

namespace {

// Fails its first `failures` deliveries, then records.
class FlakySink : public AlertSink {
public:
    explicit FlakySink(int failures) : failures_(failures) {}

    const char* name() const override { return "flaky"; }

    void deliver(const Alert& a) override {
        attempts++;
        if (failures_ > 0) {
            failures_--;
            throw std::runtime_error("endpoint down");
        }
        received.push_back(a.id);
    }

    int attempts = 0;
    std::vector<uint64_t> received;

private:
    int failures_;
};

class RecordingSink : public AlertSink {
public:
    const char* name() const override { return "recording"; }
    void deliver(const Alert& a) override { received.push_back(a.id); }

    std::vector<uint64_t> received;
};

CategoryVote makeVote(Category c, double vote) {
    CategoryVote v;
    v.category = c;
    v.vote = vote;
    v.threshold = 0.6;
    v.severity = vote >= 0.8 ? Severity::High : Severity::Medium;
    v.supporting_agents = {"a", "b"};
    v.issue = "Sticking";
    v.message = "Sticking risk detected";
    v.recommendation = "Work pipe";
    return v;
}

} // namespace

class AlertsTest {
public:
    int run_all_tests() {
        std::cout << "\n╔══════════════════════════════════════════════════════════════════╗\n";
        std::cout << "║           ALERT LIFECYCLE & PUBLISHING - UNIT TESTS              ║\n";
        std::cout << "╚══════════════════════════════════════════════════════════════════╝\n\n";

        test_raise_and_refresh();
        test_transitions();
        test_expiry();
        test_history_limit();
        test_redelivery();
        test_redelivery_gives_up();
        test_delivery_thread();
        test_single_feedback_consumer();
        test_health_flags();
        test_feedback_parsing();
        test_journal_sink();
        test_webhook_signature();

        print_summary();
        return tests_failed_ == 0 ? 0 : 1;
    }

private:
    int tests_passed_ = 0;
    int tests_failed_ = 0;

    void test_pass(const char* name) {
        std::cout << "  ✓ " << name << "\n";
        tests_passed_++;
    }

    void test_fail(const char* name, const std::string& reason) {
        std::cout << "  ✗ " << name << " - " << reason << "\n";
        tests_failed_++;
    }

    void expect(bool ok, const char* name, const std::string& reason) {
        if (ok) test_pass(name);
        else test_fail(name, reason);
    }

    // =========================================================================
    // TESTS
    // =========================================================================

    void test_raise_and_refresh() {
        std::cout << "TEST: Raise and refresh\n";
        AlertBook book;
        bool refreshed = true;

        Alert a = book.raiseOrRefresh(makeVote(Category::Sticking, 0.7), 1, WindowRef{1, 5000}, 1000, refreshed);
        expect(!refreshed && a.id == 1 && a.state == AlertState::Pending,
               "first qualifying vote raises a pending alert", std::to_string(a.id));

        Alert b = book.raiseOrRefresh(makeVote(Category::Sticking, 0.85), 2, WindowRef{2, 10000}, 2000, refreshed);
        expect(refreshed && b.id == a.id, "same category refreshes in place", std::to_string(b.id));
        expect(b.refresh_count == 1 && b.severity == Severity::High && b.window_sequence == 2,
               "refresh carries the newest vote", std::to_string(b.refresh_count));
        expect(b.raised_ms == 1000 && b.updated_ms == 2000, "raise time kept, update time moved",
               std::to_string(b.raised_ms));

        Alert c = book.raiseOrRefresh(makeVote(Category::HoleCleaning, 0.7), 2, WindowRef{2, 10000}, 2000, refreshed);
        expect(!refreshed && c.id != a.id, "other category gets its own alert", std::to_string(c.id));
        expect(book.pendingCount() == 2, "one pending alert per category",
               std::to_string(book.pendingCount()));
    }

    void test_transitions() {
        std::cout << "\nTEST: Transitions\n";
        AlertBook book;
        bool refreshed = false;
        Alert a = book.raiseOrRefresh(makeVote(Category::Sticking, 0.7), 1, WindowRef{1, 5000}, 0, refreshed);

        Alert out;
        expect(book.transition(a.id, AlertState::Confirmed, &out) && out.state == AlertState::Confirmed,
               "pending alert confirmed", toString(out.state));
        expect(!book.transition(a.id, AlertState::Dismissed), "terminal alert cannot move again", "");
        expect(!book.transition(999, AlertState::Dismissed), "unknown alert refused", "");

        Alert stored;
        expect(book.get(a.id, stored) && stored.state == AlertState::Confirmed,
               "confirmed alert reachable from history", toString(stored.state));
        expect(book.pendingCount() == 0 && book.history().size() == 1,
               "alert moved to history", std::to_string(book.history().size()));

        Alert next = book.raiseOrRefresh(makeVote(Category::Sticking, 0.7), 2, WindowRef{2, 10000}, 0, refreshed);
        expect(!refreshed && next.id != a.id, "new episode after confirmation is a new alert",
               std::to_string(next.id));
    }

    void test_expiry() {
        std::cout << "\nTEST: Expiry\n";
        AlertBookPolicy policy;
        policy.expiry_ms = 10000;
        AlertBook book(policy);
        bool refreshed = false;

        book.raiseOrRefresh(makeVote(Category::Sticking, 0.7), 1, WindowRef{1, 5000}, 1000, refreshed);
        book.raiseOrRefresh(makeVote(Category::Rop, 0.8), 1, WindowRef{1, 5000}, 8000, refreshed);

        std::vector<Alert> expired = book.expire(12000);
        expect(expired.size() == 1 && expired[0].category == Category::Sticking &&
               expired[0].state == AlertState::Expired,
               "unrefreshed alert expires", std::to_string(expired.size()));
        expect(book.pendingCount() == 1, "refreshed alert stays pending",
               std::to_string(book.pendingCount()));
    }

    void test_history_limit() {
        std::cout << "\nTEST: History limit\n";
        AlertBookPolicy policy;
        policy.history_limit = 3;
        AlertBook book(policy);

        for (uint64_t i = 1; i <= 5; ++i) {
            bool refreshed = false;
            Alert a = book.raiseOrRefresh(makeVote(Category::Sticking, 0.7), i, WindowRef{i, i * 5000}, 0, refreshed);
            book.transition(a.id, AlertState::Dismissed);
        }
        std::vector<Alert> h = book.history();
        expect(h.size() == 3 && h.front().id == 3 && h.back().id == 5,
               "oldest terminal alerts dropped", std::to_string(h.size()));
    }

    void test_redelivery() {
        std::cout << "\nTEST: Redelivery\n";
        AlertPublisher publisher;
        auto flaky = std::make_unique<FlakySink>(2);
        auto steady = std::make_unique<RecordingSink>();
        FlakySink* f = flaky.get();
        RecordingSink* r = steady.get();
        publisher.addSink(std::move(flaky));
        publisher.addSink(std::move(steady));

        Alert a;
        a.id = 42;
        publisher.publish(a);
        expect(publisher.pendingDelivery() == 1 && r->received.empty(),
               "publish only queues", std::to_string(publisher.pendingDelivery()));

        publisher.flush();
        expect(r->received.size() == 1, "healthy sink unaffected by a failing one",
               std::to_string(r->received.size()));
        expect(publisher.pendingRedelivery() == 1, "failed delivery queued",
               std::to_string(publisher.pendingRedelivery()));

        publisher.flush();
        expect(publisher.pendingRedelivery() == 1 && f->received.empty(),
               "still queued after a second failure", std::to_string(publisher.pendingRedelivery()));

        size_t ok = publisher.flush();
        expect(ok == 1 && f->received.size() == 1 && f->received[0] == 42,
               "delivered on the third attempt", std::to_string(f->attempts));
        expect(publisher.pendingRedelivery() == 0 && publisher.dropped() == 0,
               "queue empty, nothing dropped", std::to_string(publisher.dropped()));
        expect(publisher.deliveryFailures() == 2, "failures counted",
               std::to_string(publisher.deliveryFailures()));
    }

    void test_redelivery_gives_up() {
        std::cout << "\nTEST: Redelivery limit\n";
        PublisherPolicy policy;
        policy.max_attempts = 3;
        AlertPublisher publisher(policy);
        publisher.addSink(std::make_unique<FlakySink>(100));

        Alert a;
        a.id = 7;
        publisher.publish(a);
        publisher.flush();
        publisher.flush();
        publisher.flush();
        expect(publisher.pendingRedelivery() == 0 && publisher.dropped() == 1,
               "dropped after max attempts", std::to_string(publisher.dropped()));
    }

    void test_delivery_thread() {
        std::cout << "\nTEST: Delivery thread\n";
        PublisherPolicy policy;
        policy.retry_interval_ms = 50;
        AlertPublisher publisher(policy);
        auto gate = std::make_unique<GateSink>();
        GateSink* g = gate.get();
        publisher.addSink(std::move(gate));
        publisher.start();

        Alert a;
        a.id = 1;
        publisher.publish(a);
        expect(g->waitEntered(std::chrono::milliseconds(2000)),
               "delivery runs off the caller's thread", "");

        auto t0 = std::chrono::steady_clock::now();
        a.id = 2;
        publisher.publish(a);
        a.id = 3;
        publisher.publish(a);
        auto took = std::chrono::steady_clock::now() - t0;
        expect(took < std::chrono::milliseconds(50), "publish returns while the sink hangs",
               std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(took).count()));

        g->open();
        publisher.stop();
        std::vector<uint64_t> got = g->received();
        expect(got == std::vector<uint64_t>({1, 2, 3}), "queued alerts delivered in order by stop",
               std::to_string(got.size()));
        expect(publisher.pendingDelivery() == 0, "queue drained", "");
    }

    void test_single_feedback_consumer() {
        std::cout << "\nTEST: Feedback stream\n";
        AlertPublisher publisher;
        FeedbackStream& stream = publisher.subscribeFeedback();

        try {
            publisher.subscribeFeedback();
            test_fail("second subscriber refused", "no exception");
        } catch (const std::logic_error&) {
            test_pass("second subscriber refused");
        }

        FeedbackEvent e1;
        e1.event_id = "e1";
        FeedbackEvent e2;
        e2.event_id = "e2";
        publisher.submitFeedback(e1);
        publisher.submitFeedback(e2);

        FeedbackEvent out;
        bool first = stream.tryPop(out) && out.event_id == "e1";
        bool second = stream.tryPop(out) && out.event_id == "e2";
        expect(first && second, "events delivered in submission order", out.event_id);
        expect(!stream.waitPop(out, std::chrono::milliseconds(10)), "empty stream times out", "");

        stream.close();
        publisher.submitFeedback(e1);
        expect(stream.size() == 0, "closed stream drops late events", std::to_string(stream.size()));
    }

    void test_health_flags() {
        std::cout << "\nTEST: Health flags\n";
        AlertPublisher publisher;
        publisher.setDegraded(Category::Rop, true);
        publisher.raiseDivergence("rop_optimization", "STEP_TOO_LARGE");

        HealthFlags h = publisher.health();
        expect(h.degradedFor(Category::Rop) && !h.degradedFor(Category::Sticking),
               "degraded flag per category", "");
        expect(h.diverged_agents.size() == 1 && h.diverged_agents[0] == "rop_optimization",
               "divergence listed", std::to_string(h.diverged_agents.size()));

        json::object o = alert_json::toJson(h);
        expect(o.at("degraded").as_object().at("rop").as_bool() &&
               o.at("model_divergence").as_array().size() == 1,
               "health flags serialised", json::serialize(o));

        publisher.clearDivergence("rop_optimization");
        expect(!publisher.divergenceRaised("rop_optimization"), "divergence cleared", "");
    }

    void test_feedback_parsing() {
        std::cout << "\nTEST: Feedback parsing\n";
        FeedbackEvent e = alert_json::parseFeedback(
            R"({"event_id":"op-17","alert_id":3,"kind":"false_positive","source":"driller","ts_ms":1700000000000})");
        expect(e.event_id == "op-17" && e.alert_id == 3 && e.kind == FeedbackKind::FalsePositive &&
               e.source == "driller" && e.ts_ms == 1700000000000ULL,
               "false positive parsed", e.event_id);

        FeedbackEvent m = alert_json::parseFeedback(
            R"({"event_id":"op-18","kind":"MISSED","category":"washout_mud_loss"})");
        expect(m.kind == FeedbackKind::Missed && m.category == Category::WashoutMudLoss,
               "missed event names its category", toString(m.category));

        const char* bad[] = {
            "not json",
            R"({"alert_id":3,"kind":"CONFIRMED"})",
            R"({"event_id":"x","alert_id":3,"kind":"MAYBE"})",
            R"({"event_id":"x","kind":"CONFIRMED"})",
            R"({"event_id":"x","kind":"MISSED"})",
            R"({"event_id":"x","alert_id":-1,"kind":"CONFIRMED"})"
        };
        int refused = 0;
        for (const char* body : bad) {
            try {
                alert_json::parseFeedback(body);
            } catch (const std::invalid_argument&) {
                refused++;
            }
        }
        expect(refused == 6, "malformed events refused", std::to_string(refused) + "/6");
    }

    void test_journal_sink() {
        std::cout << "\nTEST: Journal sink\n";
        std::string path = "rigsense_alerts_test.jsonl";
        std::remove(path.c_str());

        JournalAlertSink sink(path);
        Alert a;
        a.id = 11;
        a.category = Category::HoleCleaning;
        a.message = "Hole Cleaning risk detected (70.0%)";
        sink.deliver(a);
        a.id = 12;
        sink.deliver(a);

        std::ifstream in(path);
        std::string line;
        std::vector<json::value> rows;
        while (std::getline(in, line)) rows.push_back(json::parse(line));
        std::remove(path.c_str());

        expect(rows.size() == 2 &&
               rows[1].as_object().at("id").as_uint64() == 12 &&
               rows[0].as_object().at("category").as_string() == "hole_cleaning",
               "one JSON object per alert", std::to_string(rows.size()));

        JournalAlertSink broken("/nonexistent-dir/alerts.jsonl");
        try {
            broken.deliver(a);
            test_fail("unwritable journal throws", "no exception");
        } catch (const std::runtime_error&) {
            test_pass("unwritable journal throws");
        }
    }

    void test_webhook_signature() {
        std::cout << "\nTEST: Webhook signature\n";
        // RFC 4231 test case 2.
        WebhookAlertSink sink("http://127.0.0.1:1/", "Jefe");
        std::string sig = sink.sign("what do ya want for nothing?");
        expect(sig == "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843",
               "HMAC-SHA256 hex digest", sig);
    }

    void print_summary() {
        std::cout << "\n╔══════════════════════════════════════════════════════════════════╗\n";
        std::cout << "║                         TEST SUMMARY                             ║\n";
        std::cout << "╠══════════════════════════════════════════════════════════════════╣\n";
        std::cout << "║  Passed: " << std::setw(3) << tests_passed_
                  << "                                                      ║\n";
        std::cout << "║  Failed: " << std::setw(3) << tests_failed_
                  << "                                                      ║\n";
        std::cout << "╚══════════════════════════════════════════════════════════════════╝\n";

        if (tests_failed_ == 0) {
            std::cout << "\n✓ ALL TESTS PASSED\n\n";
        } else {
            std::cout << "\n✗ SOME TESTS FAILED\n\n";
        }
    }
};

int main() {
    AlertsTest test;
    return test.run_all_tests();
}
