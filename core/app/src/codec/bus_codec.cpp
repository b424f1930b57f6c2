#include "riskgate/codec/bus_codec.hpp"
#include "riskgate/codec/json_codec.hpp"
#include "riskgate/domain/errors.hpp"
#include "riskgate/time/time_utils.hpp"

namespace riskgate {
namespace codec {

namespace {

bool hasTopicPrefix(const std::string& topic, const char* prefix) {
  const std::string p(prefix);
  if (topic.compare(0, p.size(), p) != 0) {
    return false;
  }
  return topic.size() == p.size() || topic[p.size()] == '.';
}

}  // namespace

std::optional<Event> decodeBusMessage(const std::string& frame) {
  const auto space = frame.find(' ');
  if (space == std::string::npos || space == 0) {
    throw ValidationError("bus message has no topic");
  }
  const std::string topic = frame.substr(0, space);

  const bool is_signal = hasTopicPrefix(topic, kSignalTopic);
  const bool is_fill = hasTopicPrefix(topic, kFillTopic);
  const bool is_price = hasTopicPrefix(topic, kPriceTopic);
  if (!is_signal && !is_fill && !is_price) {
    return std::nullopt;
  }

  nlohmann::json body;
  try {
    body = nlohmann::json::parse(frame.substr(space + 1));
  } catch (const nlohmann::json::parse_error& e) {
    throw ValidationError(topic + ": body is not JSON (" + e.what() + ")");
  }

  if (is_signal) {
    SignalEvent event;
    event.signal = signalFromJson(body);
    event.timestamp = ms_to_timestamp(event.signal.timestamp_ms);
    return Event{std::move(event)};
  }
  if (is_fill) {
    FillEvent event;
    event.fill = fillFromJson(body);
    event.timestamp = ms_to_timestamp(event.fill.timestamp_ms);
    return Event{std::move(event)};
  }

  PriceUpdate update = priceUpdateFromJson(body);
  PriceUpdateEvent event;
  event.session_id = std::move(update.session_id);
  event.prices = std::move(update.prices);
  event.timestamp = ms_to_timestamp(update.timestamp_ms);
  return Event{std::move(event)};
}

nlohmann::json decisionEventToJson(const DecisionEvent& event) {
  nlohmann::json j = signalToJson(event.signal);
  const nlohmann::json decision = decisionToJson(event.decision);
  j["session_id"] = event.session_id;
  j["approved"] = event.approved();
  j["rule"] = decision["rule"];
  j["score"] = decision["score"];
  j["rejection_reason"] = decision["reason"];
  j["details"] = decision["details"];
  j["mode"] = domain::tradingModeToString(event.mode);
  j["mode_reason"] = event.mode_reason;
  j["degraded"] = event.degraded;
  j["decided_at_ms"] = event.decided_at_ms;
  return j;
}

nlohmann::json alertEventToJson(const AlertEvent& event) {
  nlohmann::json j;
  j["kind"] = alertKindToString(event.kind);
  j["session_id"] = event.session_id;
  j["error"] = event.message;
  j["payload"] = event.payload;
  j["timestamp_ms"] = timestamp_to_ms(event.timestamp);
  return j;
}

std::optional<std::string> encodeOutbound(const Event& event) {
  if (const auto* e = std::get_if<DecisionEvent>(&event)) {
    const std::string topic =
        std::string(e->approved() ? kApprovedTopic : kRejectedTopic) + "." +
        e->signal.symbol;
    return topic + " " + decisionEventToJson(*e).dump();
  }
  if (const auto* e = std::get_if<AlertEvent>(&event)) {
    const char* topic =
        e->kind == AlertKind::InvalidMessage ? kInvalidTopic : kAlertTopic;
    return std::string(topic) + " " + alertEventToJson(*e).dump();
  }
  return std::nullopt;
}

}  // namespace codec
}  // namespace riskgate
