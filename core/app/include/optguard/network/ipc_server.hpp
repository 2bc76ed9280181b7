#pragma once

#include "optguard/concurrent/thread_safe_queue.hpp"
#include "optguard/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <cstddef>
#include <string>
#include <thread>
#include <utility>

namespace optguard {

// -----------------------------------------------------------------------------
// IpcServer — ZeroMQ front door for the decision service
// -----------------------------------------------------------------------------
//
// @brief  One worker thread serving a REP command socket and a PUB socket
//         that broadcasts every decision event as JSON.
//
// @details
//   REP (default tcp://127.0.0.1:5556): each request is handed to the
//   command handler and its return value is sent back verbatim. The socket
//   uses ZMQ_RCVTIMEO so the loop can interleave telemetry.
//
//   PUB (default tcp://127.0.0.1:5557): events pushed with pushTelemetry()
//   are buffered in a bounded ThreadSafeQueue and published by the worker
//   as two-frame messages [topic, json]. The topic is the event's "type"
//   field (e.g. "core_halt"), so subscribers can filter with
//   ZMQ_SUBSCRIBE. When the queue is full the oldest event is dropped and
//   counted.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread.
//   The command handler runs on the IPC worker thread.
//
// Ownership:
//   Owned by DecisionService via std::unique_ptr. Owns the ZMQ context,
//   both sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened until start().
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. No-op when running.
  void start();

  // Joins the worker (within kPollTimeoutMs) and closes the sockets.
  // Idempotent.
  void stop();

  void pushTelemetry(Event event);

  // {topic, payload} frames published for an event.
  static std::pair<std::string, std::string> formatTelemetry(const Event& event);

  std::size_t droppedTelemetry() const { return telemetry_queue_.dropped(); }

  static constexpr std::size_t kTelemetryCapacity = 4096;

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_{kTelemetryCapacity};
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace optguard
