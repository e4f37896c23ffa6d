#include "dtwin/network/telemetry_server.hpp"
#include "dtwin/events/event_json.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace dtwin {
namespace network {

TelemetryServer::TelemetryServer(CommandHandler command_handler,
                                 std::string cmd_endpoint,
                                 std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

TelemetryServer::~TelemetryServer() { stop(); }

void TelemetryServer::start() {
  if (running_.load() || !enabled()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  if (!cmd_endpoint_.empty()) {
    cmd_socket_ =
        std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
    cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
    cmd_socket_->set(zmq::sockopt::linger, 0);
    cmd_socket_->bind(cmd_endpoint_);
  }
  if (!pub_endpoint_.empty()) {
    pub_socket_ =
        std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);
    pub_socket_->set(zmq::sockopt::linger, 0);
    pub_socket_->bind(pub_endpoint_);
  }

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[TelemetryServer] started. CMD="
            << (cmd_endpoint_.empty() ? "-" : cmd_endpoint_)
            << " PUB=" << (pub_endpoint_.empty() ? "-" : pub_endpoint_)
            << "\n";
}

void TelemetryServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[TelemetryServer] stopped. dropped=" << queue_.dropped()
            << "\n";
}

void TelemetryServer::pushEvent(Event event) {
  if (!pub_endpoint_.empty()) {
    queue_.push(std::move(event));
  }
}

void TelemetryServer::run() {
  while (running_.load()) {
    processTelemetry();
    if (cmd_socket_) {
      processCommands();
    } else {
      // No REP socket to block on; wait on the queue instead.
      if (auto event = queue_.pop_for(std::chrono::milliseconds(kPollTimeoutMs))) {
        std::string payload = eventToJson(*event).dump();
        pub_socket_->send(zmq::buffer(payload), zmq::send_flags::dontwait);
      }
    }
  }
  processTelemetry();
}

void TelemetryServer::processTelemetry() {
  if (!pub_socket_) {
    return;
  }
  while (auto event = queue_.try_pop()) {
    std::string payload = eventToJson(*event).dump();
    zmq::message_t msg(payload.data(), payload.size());
    pub_socket_->send(msg, zmq::send_flags::dontwait);
  }
}

void TelemetryServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response = command_handler_(cmd);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

}  // namespace network
}  // namespace dtwin
