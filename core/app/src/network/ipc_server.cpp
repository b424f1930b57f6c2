#include "riskgate/network/ipc_server.hpp"
#include "riskgate/codec/bus_codec.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

namespace riskgate {

IpcServer::IpcServer(CommandHandler handler, std::string command_endpoint,
                     std::string publish_endpoint)
    : handler_(std::move(handler)),
      command_endpoint_(std::move(command_endpoint)),
      publish_endpoint_(std::move(publish_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

void IpcServer::start() {
  if (thread_.joinable()) {
    return;
  }

  if (!command_endpoint_.empty()) {
    responder_ = std::make_unique<zmq::socket_t>(context_, zmq::socket_type::rep);
    responder_->set(zmq::sockopt::linger, 0);
    responder_->bind(command_endpoint_);
  }
  if (!publish_endpoint_.empty()) {
    publisher_ = std::make_unique<zmq::socket_t>(context_, zmq::socket_type::pub);
    publisher_->set(zmq::sockopt::linger, 0);
    publisher_->bind(publish_endpoint_);
  }

  stopping_.store(false);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] listening. commands="
            << (responder_ ? command_endpoint_ : std::string("off"))
            << " decisions="
            << (publisher_ ? publish_endpoint_ : std::string("off")) << "\n";
}

void IpcServer::stop() {
  if (!thread_.joinable()) {
    return;
  }
  stopping_.store(true);
  outbound_.close();
  thread_.join();

  responder_.reset();
  publisher_.reset();
  std::cout << "[IpcServer] stopped. published=" << published_.load()
            << " commands=" << commands_served_.load() << "\n";
}

void IpcServer::pushOutbound(Event event) {
  outbound_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run()
// -----------------------------------------------------------------------------
// Alternates between flushing decisions and waiting briefly for a command.
// A socket error is logged and the loop continues; only stop() ends it.
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (!stopping_.load()) {
    try {
      publishPending();
      if (responder_) {
        zmq::pollitem_t item{responder_->handle(), 0, ZMQ_POLLIN, 0};
        zmq::poll(&item, 1, std::chrono::milliseconds(kCommandPollMs));
        if (item.revents & ZMQ_POLLIN) {
          answerCommand();
        }
      } else if (std::optional<Event> event = outbound_.popFor(
                     std::chrono::milliseconds(kCommandPollMs))) {
        publishOne(*event);
      }
    } catch (const zmq::error_t& e) {
      if (e.num() == ETERM) {
        break;
      }
      std::cerr << "[IpcServer] ERROR: " << e.what() << "\n";
    }
  }

  try {
    publishPending();
  } catch (const zmq::error_t& e) {
    std::cerr << "[IpcServer] ERROR: final publish failed: " << e.what()
              << "\n";
  }
}

void IpcServer::publishPending() {
  while (std::optional<Event> event = outbound_.try_pop()) {
    publishOne(*event);
  }
}

void IpcServer::publishOne(const Event& event) {
  if (!publisher_) {
    return;
  }
  const std::optional<std::string> frame = codec::encodeOutbound(event);
  if (frame && publisher_->send(zmq::buffer(*frame), zmq::send_flags::dontwait)) {
    published_.fetch_add(1);
  }
}

void IpcServer::answerCommand() {
  zmq::message_t request;
  if (!responder_->recv(request, zmq::recv_flags::dontwait)) {
    return;
  }

  std::string reply;
  try {
    reply = handler_(
        std::string(static_cast<const char*>(request.data()), request.size()));
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] WARNING: command failed: " << e.what() << "\n";
    reply = nlohmann::json{{"status", "error"}, {"error", e.what()}}.dump();
  }
  commands_served_.fetch_add(1);
  responder_->send(zmq::buffer(reply), zmq::send_flags::none);
}

}  // namespace riskgate
