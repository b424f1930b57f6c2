#pragma once

#include "riskgate/events/alert_event.hpp"
#include "riskgate/events/decision_event.hpp"
#include "riskgate/events/event.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace riskgate {
namespace codec {

// Topic prefixes of single-frame bus messages: "<topic> <json>".
inline constexpr const char* kSignalTopic = "strategy.signals";
inline constexpr const char* kFillTopic = "execution.fills";
inline constexpr const char* kPriceTopic = "market.prices";
inline constexpr const char* kApprovedTopic = "risk.approved";
inline constexpr const char* kRejectedTopic = "risk.rejected";
inline constexpr const char* kInvalidTopic = "risk.invalid";
inline constexpr const char* kAlertTopic = "risk.alerts";

// -----------------------------------------------------------------------------
// decodeBusMessage
// -----------------------------------------------------------------------------
//
// @brief  Turns one inbound bus frame into a SignalEvent, FillEvent or
//         PriceUpdateEvent.
//
// @return std::nullopt for topics outside the three inbound families.
//
// @throws ValidationError when the frame has no topic, the body is not JSON,
//         or the body fails field validation.
// -----------------------------------------------------------------------------
std::optional<Event> decodeBusMessage(const std::string& frame);

nlohmann::json decisionEventToJson(const DecisionEvent& event);
nlohmann::json alertEventToJson(const AlertEvent& event);

// "risk.approved.<symbol> {...}", "risk.rejected.<symbol> {...}",
// "risk.invalid {...}" or "risk.alerts {...}". std::nullopt for event types
// that are not published.
std::optional<std::string> encodeOutbound(const Event& event);

}  // namespace codec
}  // namespace riskgate
