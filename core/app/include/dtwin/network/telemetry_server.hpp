#pragma once

#include "dtwin/concurrent/thread_safe_queue.hpp"
#include "dtwin/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace dtwin {
namespace network {

// -----------------------------------------------------------------------------
// TelemetryServer — ZeroMQ event stream and command endpoint
// -----------------------------------------------------------------------------
//
// @brief  Runs one background thread that publishes recorded events as JSON
//         on a PUB socket and answers text commands on a REP socket.
//
// @details
// Sockets:
//   PUB  every event passed to pushEvent(), serialized with eventToJson().
//   REP  one request, one reply. The request text is passed to the command
//        handler (TwinEngine::executeCommand) and its JSON reply is sent
//        back.
//
// Either endpoint may be empty, in which case that socket is not created.
// With both empty, start() is a no-op and pushEvent() drops events.
//
// Hand-off: the simulation thread only pushes into a bounded
// ThreadSafeQueue. Serialization and socket I/O happen on the telemetry
// thread, so a slow subscriber can never stall a run; when the queue is full
// the oldest event is dropped.
//
// Thread model:
//   start()/stop() on the owning thread. pushEvent() from any thread. The
//   command handler runs on the telemetry thread and must be thread-safe.
//
// Ownership:
//   Owned by TwinEngine via std::unique_ptr. Owns the ZMQ context, sockets,
//   queue and thread.
// -----------------------------------------------------------------------------
class TelemetryServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  TelemetryServer(CommandHandler command_handler, std::string cmd_endpoint,
                  std::string pub_endpoint);
  ~TelemetryServer();

  TelemetryServer(const TelemetryServer&) = delete;
  TelemetryServer& operator=(const TelemetryServer&) = delete;

  void start();
  void stop();

  void pushEvent(Event event);

  bool running() const { return running_.load(); }
  bool enabled() const { return !cmd_endpoint_.empty() || !pub_endpoint_.empty(); }
  std::size_t droppedEvents() const { return queue_.dropped(); }

 private:
  static constexpr int kPollTimeoutMs = 50;
  static constexpr std::size_t kQueueCapacity = 10000;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> queue_{kQueueCapacity};
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace network
}  // namespace dtwin
