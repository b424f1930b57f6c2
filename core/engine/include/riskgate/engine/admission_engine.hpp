#pragma once

#include "riskgate/concurrent/event_loop_thread.hpp"
#include "riskgate/concurrent/periodic_task.hpp"
#include "riskgate/config/engine_config.hpp"
#include "riskgate/eventbus/event_bus.hpp"
#include "riskgate/events/event.hpp"
#include "riskgate/network/bus_thread.hpp"
#include "riskgate/network/ipc_server.hpp"
#include "riskgate/persistence/i_ledger_store.hpp"
#include "riskgate/pipeline/admission_pipeline.hpp"
#include "riskgate/time/i_time_provider.hpp"
#include "riskgate/time/simulation_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace riskgate {

// -----------------------------------------------------------------------------
// AdmissionEngine
// -----------------------------------------------------------------------------
//
// @brief  Wires the admission pipeline to its threads and sockets.
//
// @details
// Thread layout after start():
//
//   bus thread      BusGateway SUB loop -> pushEvent()
//   shard-0..N-1    one EventLoopThread per shard; every event of a session
//                   lands on shard hash(session) % N, so a session has a
//                   single writer and keeps arrival order
//   outbound        EventLoopThread carrying DecisionEvent / AlertEvent to
//                   subscribers of decisionEventBus() and the IPC publisher
//   ipc             IpcServer REP + PUB loop, commands -> executeCommand()
//   housekeeping    PeriodicTask: evict stale pending signals, append
//                   snapshots; runs once more on cancel
//
// Empty endpoints in EngineSettings skip the matching thread, which is how
// tests drive the engine through pushEvent() alone.
//
// Ownership:
//   Owns the store, pipeline, shards and network components. The clock is
//   borrowed and must outlive the engine. When `sim_clock` is given the bus
//   gateway advances it from inbound message timestamps.
// -----------------------------------------------------------------------------
class AdmissionEngine {
 public:
  static constexpr std::chrono::milliseconds kSessionControlTimeout{5000};
  static constexpr std::size_t kDefaultHistoryLimit = 50;

  AdmissionEngine(EngineConfig config, const ITimeProvider& clock,
                  SimulationTimeProvider* sim_clock = nullptr);

  ~AdmissionEngine();

  AdmissionEngine(const AdmissionEngine&) = delete;
  AdmissionEngine& operator=(const AdmissionEngine&) = delete;
  AdmissionEngine(AdmissionEngine&&) = delete;
  AdmissionEngine& operator=(AdmissionEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // @brief  Opens the store, builds the pipeline and starts every thread.
  //
  // @details
  // Order: store -> pipeline -> shard loops -> outbound loop -> IPC server
  // -> housekeeping task -> bus thread (last, so inbound traffic only
  // starts once everything downstream is ready).
  //
  // @throws PersistenceError if the data directory cannot be created,
  //         zmq::error_t if an endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  //
  // @brief  Stops inbound traffic first, drains the shards and the outbound
  //         loop, then takes a final snapshot. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  // Routes an inbound event to its shard. Safe from any thread.
  void pushEvent(Event event);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  Answers one IPC command with a JSON document carrying "status"
  //         ("ok" or "error", the latter with "error").
  //
  // @details
  //   PING
  //   STATUS [session]
  //   BUYING_POWER <session>
  //   PERSISTENCE
  //   CLOSE <session>            final persist, then forget the session
  //   RESET <session>            wipe its records, reopen at initial capital
  //   TRANSACTIONS <session> [n] newest first, default 50, 0 = all
  //   SNAPSHOTS <session> [n]
  //   DECISIONS <session> [n]    every audited decision
  //   REJECTIONS <session> [n]   rejected decisions only
  //   PERFORMANCE <session>      win rate, profit factor, max drawdown
  //
  // CLOSE and RESET run on the session's shard; the caller blocks until
  // the shard has answered or kSessionControlTimeout has passed.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // Decisions and alerts are published here on the outbound thread.
  EventBus& decisionEventBus() { return outbound_loop_.eventBus(); }

  // nullptr before start() and after stop().
  AdmissionPipeline* pipeline() { return pipeline_.get(); }

  std::size_t shardCount() const { return config_.engine.shard_count; }
  std::size_t shardFor(const std::string& session_id) const;

  bool running() const { return running_.load(); }

 private:
  void handleSignal(const SignalEvent& event);
  void handleFill(const FillEvent& event);
  void handlePrices(std::size_t shard, const PriceUpdateEvent& event);
  void handleSessionControl(const SessionControlEvent& event);

  std::string controlSession(SessionAction action,
                             const std::string& session_id);

  // Read-only commands. Leaves `response` null for an unknown verb; store
  // failures escape as PersistenceError.
  void answerQuery(const std::string& verb, const std::string& session,
                   std::size_t limit, nlohmann::json& response);

  void publishAlert(AlertKind kind, std::string session_id,
                    std::string message, std::string payload);

  std::unique_ptr<ILedgerStore> makeStore() const;

  const EngineConfig config_;
  const ITimeProvider& clock_;
  SimulationTimeProvider* sim_clock_;

  std::unique_ptr<ILedgerStore> store_;
  std::unique_ptr<AdmissionPipeline> pipeline_;

  std::vector<std::unique_ptr<EventLoopThread>> shards_;
  EventLoopThread outbound_loop_{"outbound"};
  std::vector<EventBus::SubscriptionId> outbound_bridges_;

  std::unique_ptr<IpcServer> ipc_server_;
  std::unique_ptr<BusThread> bus_thread_;
  std::unique_ptr<PeriodicTask> housekeeping_;

  std::atomic<std::uint64_t> next_sequence_{1};
  std::atomic<bool> running_{false};
};

}  // namespace riskgate
