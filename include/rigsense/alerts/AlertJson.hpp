#pragma once

#include <string>

#include <boost/json.hpp>

#include "rigsense/alerts/Alert.hpp"

namespace rigsense {
namespace alert_json {

boost::json::object toJson(const Alert& a);
boost::json::object toJson(const FeedbackEvent& e);
boost::json::object toJson(const HealthFlags& h);

// Accepts {"event_id", "alert_id", "kind", "category", "source", "ts_ms"}.
// kind is CONFIRMED, FALSE_POSITIVE or MISSED; Missed requires category.
// Throws std::invalid_argument on a malformed event.
FeedbackEvent feedbackFromJson(const boost::json::value& v);
FeedbackEvent parseFeedback(const std::string& body);

std::string serialize(const Alert& a);

} // namespace alert_json
} // namespace rigsense
