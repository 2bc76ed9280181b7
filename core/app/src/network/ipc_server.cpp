#include "optguard/network/ipc_server.hpp"

#include "optguard/codec/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace optguard {

IpcServer::IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] listening. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

void IpcServer::stop() {
  if (!running_.exchange(false)) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  if (!telemetry_queue_.push(std::move(event))) {
    const auto dropped = telemetry_queue_.dropped();
    if (dropped == 1 || dropped % 1000 == 0) {
      std::cerr << "[IpcServer] telemetry backlog full; " << dropped
                << " event(s) dropped so far\n";
    }
  }
}

void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }

  // Publish whatever was decided before shutdown.
  processTelemetry();
}

void IpcServer::processTelemetry() {
  for (const auto& event : telemetry_queue_.drain()) {
    const auto [topic, payload] = formatTelemetry(event);
    zmq::message_t topic_frame(topic.data(), topic.size());
    zmq::message_t payload_frame(payload.data(), payload.size());
    if (!pub_socket_->send(topic_frame,
                           zmq::send_flags::sndmore | zmq::send_flags::dontwait) ||
        !pub_socket_->send(payload_frame, zmq::send_flags::dontwait)) {
      std::cerr << "[IpcServer] telemetry '" << topic
                << "' not sent (socket busy)\n";
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one request/reply round per call
// -----------------------------------------------------------------------------
// REP requires exactly one reply per request, so a handler exception is
// turned into an error reply rather than leaving the socket stuck.
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
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
  std::string response;
  try {
    response = command_handler_(cmd);
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] command failed: " << e.what() << "\n";
    response = nlohmann::json{{"status", "error"}, {"response", e.what()}}.dump();
  }

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

std::pair<std::string, std::string> IpcServer::formatTelemetry(
    const Event& event) {
  const auto j = codec::eventToJson(event);
  return {j.at("type").get<std::string>(), j.dump()};
}

}  // namespace optguard
