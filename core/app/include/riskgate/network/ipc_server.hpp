#pragma once

#include "riskgate/concurrent/thread_safe_queue.hpp"
#include "riskgate/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace riskgate {

// -----------------------------------------------------------------------------
// IpcServer: decision publisher and command responder
// -----------------------------------------------------------------------------
//
// @brief  One thread owning a ZeroMQ PUB socket for outbound decisions and
//         alerts, and a REP socket for operator commands.
//
// @details
// Outbound events are queued by pushOutbound() (the engine's outbound loop
// calls it) and encoded with codec::encodeOutbound() on the IPC thread, so
// shards never touch a socket. Frames go out as "<topic> <json>".
//
// Commands are plain text ("STATUS bt-1"). The reply is whatever the
// handler returns; a handler exception becomes
// {"status":"error","error":<what>} so the REP socket never stalls waiting
// for a reply that was not sent.
//
// An empty endpoint disables that socket.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  IpcServer(CommandHandler handler, std::string command_endpoint,
            std::string publish_endpoint);
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;

  // @throws zmq::error_t if an endpoint cannot be bound.
  void start();

  // Publishes whatever is still queued, closes both sockets and joins.
  void stop();

  void pushOutbound(Event event);

  std::uint64_t published() const { return published_.load(); }
  std::uint64_t commandsServed() const { return commands_served_.load(); }

 private:
  // Upper bound on how long the thread waits for a command before it
  // flushes the outbound queue again.
  static constexpr long kCommandPollMs = 20;

  void run();
  void publishPending();
  void publishOne(const Event& event);
  void answerCommand();

  CommandHandler handler_;
  std::string command_endpoint_;
  std::string publish_endpoint_;

  zmq::context_t context_{1};
  std::unique_ptr<zmq::socket_t> responder_;
  std::unique_ptr<zmq::socket_t> publisher_;

  ThreadSafeQueue<Event> outbound_;
  std::atomic<bool> stopping_{false};
  std::atomic<std::uint64_t> published_{0};
  std::atomic<std::uint64_t> commands_served_{0};
  std::thread thread_;
};

}  // namespace riskgate
