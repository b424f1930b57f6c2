#include "riskgate/engine/admission_engine.hpp"
#include "riskgate/codec/json_codec.hpp"
#include "riskgate/domain/errors.hpp"
#include "riskgate/network/zmq_buying_power_client.hpp"
#include "riskgate/persistence/in_memory_ledger_store.hpp"
#include "riskgate/persistence/json_file_ledger_store.hpp"
#include "riskgate/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace riskgate {

AdmissionEngine::AdmissionEngine(EngineConfig config,
                                 const ITimeProvider& clock,
                                 SimulationTimeProvider* sim_clock)
    : config_(std::move(config)), clock_(clock), sim_clock_(sim_clock) {}

AdmissionEngine::~AdmissionEngine() { stop(); }

std::unique_ptr<ILedgerStore> AdmissionEngine::makeStore() const {
  if (config_.engine.data_directory.empty()) {
    return std::make_unique<InMemoryLedgerStore>();
  }
  return std::make_unique<JsonFileLedgerStore>(config_.engine.data_directory);
}

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void AdmissionEngine::start() {
  if (running_.load()) {
    return;
  }
  const EngineSettings& settings = config_.engine;

  // ---  1) Store and pipeline -----------------------------------------------
  store_ = makeStore();
  std::unique_ptr<IBuyingPowerSource> remote;
  if (!settings.buying_power_endpoint.empty()) {
    remote = std::make_unique<ZmqBuyingPowerClient>(
        settings.buying_power_endpoint);
  }
  pipeline_ = std::make_unique<AdmissionPipeline>(config_.limits, clock_,
                                                  *store_, std::move(remote));

  // ---  2) Shard loops --------------------------------------------------------
  const std::size_t shard_count = std::max<std::size_t>(1, settings.shard_count);
  shards_.clear();
  for (std::size_t i = 0; i < shard_count; ++i) {
    auto shard =
        std::make_unique<EventLoopThread>("shard-" + std::to_string(i));
    EventBus& bus = shard->eventBus();
    bus.subscribe<SignalEvent>(
        [this](const SignalEvent& e) { handleSignal(e); });
    bus.subscribe<FillEvent>([this](const FillEvent& e) { handleFill(e); });
    bus.subscribe<PriceUpdateEvent>(
        [this, i](const PriceUpdateEvent& e) { handlePrices(i, e); });
    bus.subscribe<SessionControlEvent>(
        [this](const SessionControlEvent& e) { handleSessionControl(e); });
    shard->start();
    shards_.push_back(std::move(shard));
  }

  // ---  3) Outbound loop ------------------------------------------------------
  outbound_loop_.start();

  // ---  4) IPC server ---------------------------------------------------------
  if (!settings.command_endpoint.empty() ||
      !settings.publish_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        settings.command_endpoint, settings.publish_endpoint);
    ipc_server_->start();

    outbound_bridges_.push_back(
        outbound_loop_.eventBus().subscribe<DecisionEvent>(
            [this](const DecisionEvent& e) {
              if (ipc_server_) {
                ipc_server_->pushOutbound(e);
              }
            }));
    outbound_bridges_.push_back(outbound_loop_.eventBus().subscribe<AlertEvent>(
        [this](const AlertEvent& e) {
          if (ipc_server_) {
            ipc_server_->pushOutbound(e);
          }
        }));
  }

  // ---  5) Housekeeping -------------------------------------------------------
  housekeeping_ = std::make_unique<PeriodicTask>(
      "housekeeping", std::chrono::milliseconds(settings.snapshot_interval_ms),
      [this] {
        pipeline_->evictStalePending();
        pipeline_->persistSnapshots();
      },
      /*run_on_cancel=*/true);
  housekeeping_->start();

  running_.store(true);

  // ---  6) Bus thread LAST (inbound traffic begins) --------------------------
  if (!settings.bus_endpoint.empty()) {
    bus_thread_ = std::make_unique<BusThread>(
        [this](Event event) { pushEvent(std::move(event)); },
        settings.bus_endpoint, sim_clock_);
    bus_thread_->start();
  }

  std::cout << "[AdmissionEngine] started. Shards: " << shards_.size()
            << ", store: " << store_->kind()
            << ", buying power: "
            << (settings.buying_power_endpoint.empty()
                    ? std::string("in-process")
                    : settings.buying_power_endpoint)
            << (bus_thread_ ? ", bus: " + settings.bus_endpoint : std::string())
            << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void AdmissionEngine::stop() {
  if (!running_.load()) {
    return;
  }

  // ---  1) Stop inbound traffic FIRST ----------------------------------------
  bus_thread_.reset();
  running_.store(false);

  // ---  2) Drain shards (queued fills are still applied) ---------------------
  for (auto& shard : shards_) {
    shard->stop();
  }

  // ---  3) Drain outbound, then let the IPC server publish what it holds -----
  outbound_loop_.stop();
  for (auto id : outbound_bridges_) {
    outbound_loop_.eventBus().unsubscribe(id);
  }
  outbound_bridges_.clear();
  ipc_server_.reset();

  // ---  4) Final housekeeping pass (run_on_cancel) ----------------------------
  if (housekeeping_) {
    housekeeping_->cancel();
    housekeeping_->completion().wait();
    housekeeping_.reset();
  }

  const PersistenceStats stats = pipeline_->persistence().stats();
  std::cout << "[AdmissionEngine] stopped. Sessions: "
            << pipeline_->sessions().size()
            << ", persistence ok/failed: " << stats.successes << "/"
            << stats.failures << ".\n";

  shards_.clear();
  pipeline_.reset();
  store_.reset();
}

// -----------------------------------------------------------------------------
// Routing
// -----------------------------------------------------------------------------
std::size_t AdmissionEngine::shardFor(const std::string& session_id) const {
  const std::size_t n = std::max<std::size_t>(1, config_.engine.shard_count);
  return std::hash<std::string>{}(session_id) % n;
}

void AdmissionEngine::pushEvent(Event event) {
  if (!running_.load()) {
    std::cerr << "[AdmissionEngine] WARNING: event dropped, engine not "
                 "running\n";
    return;
  }
  const std::uint64_t seq = next_sequence_.fetch_add(1);

  if (auto* e = std::get_if<SignalEvent>(&event)) {
    e->sequence_id = seq;
    const auto session = domain::resolveSessionId(e->signal.backtest_id);
    shards_[shardFor(session)]->push(std::move(event));
  } else if (auto* e = std::get_if<FillEvent>(&event)) {
    e->sequence_id = seq;
    const auto session = domain::resolveSessionId(e->fill.backtest_id);
    shards_[shardFor(session)]->push(std::move(event));
  } else if (auto* e = std::get_if<PriceUpdateEvent>(&event)) {
    e->sequence_id = seq;
    if (e->session_id.empty()) {
      // Every shard re-marks the sessions it owns.
      for (auto& shard : shards_) {
        shard->push(event);
      }
    } else {
      shards_[shardFor(e->session_id)]->push(std::move(event));
    }
  } else if (auto* e = std::get_if<SessionControlEvent>(&event)) {
    e->sequence_id = seq;
    shards_[shardFor(e->session_id)]->push(std::move(event));
  } else if (auto* e = std::get_if<AlertEvent>(&event)) {
    e->sequence_id = seq;
    outbound_loop_.push(std::move(event));
  }
}

// -----------------------------------------------------------------------------
// Shard handlers
// -----------------------------------------------------------------------------
void AdmissionEngine::handleSignal(const SignalEvent& event) {
  AdmissionResult result;
  try {
    result = pipeline_->evaluate(event.signal);
  } catch (const ValidationError& e) {
    publishAlert(AlertKind::InvalidMessage,
                 domain::resolveSessionId(event.signal.backtest_id), e.what(),
                 codec::signalToJson(event.signal).dump());
    return;
  }

  DecisionEvent decision;
  decision.session_id = result.session_id;
  decision.signal = result.signal;
  decision.decision = std::move(result.decision);
  decision.mode = result.mode.mode;
  decision.mode_reason = result.mode.reason;
  decision.degraded = result.degraded;
  decision.decided_at_ms = result.decided_at_ms;
  decision.timestamp = ms_to_timestamp(result.decided_at_ms);
  decision.sequence_id = event.sequence_id;
  outbound_loop_.push(std::move(decision));
}

void AdmissionEngine::handleFill(const FillEvent& event) {
  const std::string session = domain::resolveSessionId(event.fill.backtest_id);
  try {
    FillOutcome outcome = pipeline_->onFill(event.fill);
    if (!outcome.persisted) {
      publishAlert(AlertKind::Persistence, session,
                   outcome.persistence_error, event.fill.fill_id);
    }
  } catch (const ConsistencyError& e) {
    publishAlert(AlertKind::Consistency, session, e.what(),
                 codec::fillToJson(event.fill).dump());
  } catch (const ValidationError& e) {
    publishAlert(AlertKind::InvalidMessage, session, e.what(),
                 codec::fillToJson(event.fill).dump());
  }
}

void AdmissionEngine::handlePrices(std::size_t shard,
                                   const PriceUpdateEvent& event) {
  if (!event.session_id.empty()) {
    pipeline_->updateMarketPrices(event.session_id, event.prices);
    return;
  }
  for (const auto& session : pipeline_->sessions().sessionIds()) {
    if (shardFor(session) == shard) {
      pipeline_->updateMarketPrices(session, event.prices);
    }
  }
}

void AdmissionEngine::handleSessionControl(const SessionControlEvent& event) {
  const std::string& session = event.session_id;
  nlohmann::json response;
  try {
    if (event.action == SessionAction::Close) {
      if (auto closure = pipeline_->closeSession(session)) {
        nlohmann::json final_state = codec::snapshotToJson(closure->final_state);
        final_state.erase("processed_fill_ids");
        response["status"] = "ok";
        response["closed"] = session;
        response["final_state"] = std::move(final_state);
        response["dropped_pending"] = closure->dropped_pending;
        response["persisted"] = closure->persisted;
        if (!closure->persisted) {
          publishAlert(AlertKind::Persistence, session,
                       closure->persistence_error, "CLOSE " + session);
        }
      } else {
        response["status"] = "error";
        response["error"] = "unknown session '" + session + "'";
      }
    } else {
      const domain::PortfolioState state = pipeline_->resetSession(session);
      response["status"] = "ok";
      response["reset"] = session;
      response["portfolio"] = codec::portfolioStateToJson(state);
    }
  } catch (const RiskGateError& e) {
    response["status"] = "error";
    response["error"] = e.what();
  }
  if (event.reply) {
    event.reply->set_value(response.dump());
  }
}

void AdmissionEngine::publishAlert(AlertKind kind, std::string session_id,
                                   std::string message, std::string payload) {
  AlertEvent alert;
  alert.kind = kind;
  alert.session_id = std::move(session_id);
  alert.message = std::move(message);
  alert.payload = std::move(payload);
  alert.timestamp = ms_to_timestamp(clock_.now_ms());
  alert.sequence_id = next_sequence_.fetch_add(1);
  outbound_loop_.push(std::move(alert));
}

// -----------------------------------------------------------------------------
// controlSession(): hands CLOSE / RESET to the owning shard and waits
// -----------------------------------------------------------------------------
std::string AdmissionEngine::controlSession(SessionAction action,
                                            const std::string& session_id) {
  auto reply = std::make_shared<std::promise<std::string>>();
  std::future<std::string> answer = reply->get_future();

  SessionControlEvent control;
  control.session_id = session_id;
  control.action = action;
  control.reply = std::move(reply);
  control.timestamp = ms_to_timestamp(clock_.now_ms());
  control.sequence_id = next_sequence_.fetch_add(1);

  nlohmann::json response;
  if (!running_.load() ||
      !shards_[shardFor(session_id)]->push(std::move(control))) {
    response["status"] = "error";
    response["error"] = "engine not running";
    return response.dump();
  }
  if (answer.wait_for(kSessionControlTimeout) != std::future_status::ready) {
    std::cerr << "[AdmissionEngine] WARNING: shard did not answer for '"
              << session_id << "' within " << kSessionControlTimeout.count()
              << "ms" << std::endl;
    response["status"] = "error";
    response["error"] = "timed out waiting for session '" + session_id + "'";
    return response.dump();
  }
  return answer.get();
}

// -----------------------------------------------------------------------------
// executeCommand(): IPC query surface
// -----------------------------------------------------------------------------
std::string AdmissionEngine::executeCommand(const std::string& cmd) {
  std::istringstream in(cmd);
  std::string verb;
  std::string session;
  std::string limit_text;
  in >> verb >> session >> limit_text;

  nlohmann::json response;
  auto fail = [&response](const std::string& message) {
    response["status"] = "error";
    response["error"] = message;
  };

  if (verb == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
    return response.dump();
  }
  if (!pipeline_) {
    fail("engine not running");
    return response.dump();
  }

  std::size_t limit = kDefaultHistoryLimit;
  if (!limit_text.empty()) {
    try {
      limit = static_cast<std::size_t>(std::stoul(limit_text));
    } catch (const std::logic_error&) {
      fail("invalid limit '" + limit_text + "'");
      return response.dump();
    }
  }
  const bool needs_session =
      verb == "BUYING_POWER" || verb == "CLOSE" || verb == "RESET" ||
      verb == "TRANSACTIONS" || verb == "SNAPSHOTS" || verb == "DECISIONS" ||
      verb == "REJECTIONS" || verb == "PERFORMANCE";
  if (needs_session && session.empty()) {
    fail("usage: " + verb + " <session>");
    return response.dump();
  }

  if (verb == "CLOSE") {
    return controlSession(SessionAction::Close, session);
  }
  if (verb == "RESET") {
    return controlSession(SessionAction::Reset, session);
  }

  try {
    answerQuery(verb, session, limit, response);
  } catch (const RiskGateError& e) {
    fail(e.what());
  }
  if (response.is_null()) {
    fail("Unknown command: " + cmd);
  }
  return response.dump();
}

void AdmissionEngine::answerQuery(const std::string& verb,
                                  const std::string& session,
                                  std::size_t limit, nlohmann::json& response) {
  auto fail = [&response](const std::string& message) {
    response["status"] = "error";
    response["error"] = message;
  };

  if (verb == "STATUS") {
    if (session.empty()) {
      response["status"] = "ok";
      response["sessions"] = pipeline_->sessions().sessionIds();
      nlohmann::json shards = nlohmann::json::array();
      for (const auto& shard : shards_) {
        shards.push_back({{"name", shard->name()},
                          {"pending", shard->pending()},
                          {"failed_dispatches", shard->failedDispatches()}});
      }
      response["shards"] = std::move(shards);
    } else if (auto state = pipeline_->portfolioState(session)) {
      response["status"] = "ok";
      response["portfolio"] = codec::portfolioStateToJson(*state);
      if (auto daily = pipeline_->dailyStats(session)) {
        response["daily_stats"] = codec::dailyStatsToJson(*daily);
      }
      if (auto mode = pipeline_->mode(session)) {
        response["mode"] = domain::tradingModeToString(mode->mode);
        response["mode_reason"] = mode->reason;
      }
      response["pending_signals"] = pipeline_->pendingCount(session);
    } else {
      fail("unknown session '" + session + "'");
    }
  } else if (verb == "BUYING_POWER") {
    if (auto state = pipeline_->portfolioState(session)) {
      response["status"] = "ok";
      response["buyingPower"] = state->buying_power;
    } else {
      fail("unknown session '" + session + "'");
    }
  } else if (verb == "PERSISTENCE") {
    const PersistenceStats stats = pipeline_->persistence().stats();
    response["status"] = "ok";
    response["store"] = pipeline_->store().kind();
    response["successes"] = stats.successes;
    response["failures"] = stats.failures;
    response["last_error"] = stats.last_error;
    response["last_failed_operation"] = stats.last_failed_operation;
    response["last_failure_ms"] = stats.last_failure_ms;
  } else if (verb == "TRANSACTIONS") {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& record : pipeline_->transactions(session, limit)) {
      list.push_back(codec::transactionToJson(record));
    }
    response["status"] = "ok";
    response["session"] = session;
    response["transactions"] = std::move(list);
  } else if (verb == "SNAPSHOTS") {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& snapshot : pipeline_->snapshots(session, limit)) {
      nlohmann::json j = codec::snapshotToJson(snapshot);
      j.erase("processed_fill_ids");
      list.push_back(std::move(j));
    }
    response["status"] = "ok";
    response["session"] = session;
    response["snapshots"] = std::move(list);
  } else if (verb == "DECISIONS" || verb == "REJECTIONS") {
    const bool rejected_only = verb == "REJECTIONS";
    nlohmann::json list = nlohmann::json::array();
    for (const auto& record :
         pipeline_->decisions(session, limit, rejected_only)) {
      list.push_back(codec::decisionRecordToJson(record));
    }
    response["status"] = "ok";
    response["session"] = session;
    response[rejected_only ? "rejections" : "decisions"] = std::move(list);
  } else if (verb == "PERFORMANCE") {
    if (auto metrics = pipeline_->performance(session)) {
      response["status"] = "ok";
      response["session"] = session;
      response["performance"] = codec::performanceToJson(*metrics);
    } else {
      fail("unknown session '" + session + "'");
    }
  }
}

}  // namespace riskgate
