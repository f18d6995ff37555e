/* @file BrokerClient.cpp
 * @brief request/reply over the broker socket, error bodies mapped back onto exceptions
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdlib>
#include <stdexcept>

// devbroker headers
#include "client/BrokerClient.hpp"
#include "core/BrokerConfig.hpp"
#include "core/Errors.hpp"
#include "io/StreamSocket.hpp"
#include "protocols/Request.hpp"
#include "protocols/Response.hpp"

using namespace devbroker::client;
using namespace devbroker::protocols;
namespace core = devbroker::core;

namespace {

  std::string resolveSocketPath(std::string explicitPath) {
    if (!explicitPath.empty())
      return explicitPath;
    if (const char* env = std::getenv(core::kSocketEnvVar); env && *env)
      return env;
    throw std::runtime_error(std::string("[BrokerClient] no socket path given and $") +
                             core::kSocketEnvVar + " is not set");
  }

  [[noreturn]] void rethrow(const Response& reply) {
    const std::string type = reply.errorType();
    const std::string message = reply.errorMessage();
    if (type == "ExecutionError")
      throw core::ExecutionError(message);
    if (type == "ConnectionError")
      throw core::ConnectionError(message);
    if (type == "ProtocolError")
      throw core::ProtocolError(message);
    if (type == "UnknownCommandError")
      throw core::UnknownCommandError(message);
    throw core::BrokerError(message);
  }

} // namespace

BrokerClient::BrokerClient(std::string socketPath, std::chrono::milliseconds timeout,
                           std::size_t maxFrameBytes)
    : socketPath_(resolveSocketPath(std::move(socketPath))), timeout_(timeout),
      maxFrameBytes_(maxFrameBytes) {}

BrokerClient::~BrokerClient() = default;

bool BrokerClient::ping() { return checked(Request{ PingRequest{} }) == "pong"; }

bool BrokerClient::connect(const std::string& hostname) {
  const auto body = checked(Request{ ConnectRequest{ hostname } });
  return body.is_boolean() && body.get<bool>();
}

std::string BrokerClient::execute(const std::string& hostname, const std::string& command) {
  const auto body = checked(Request{ ExecuteRequest{ hostname, command } });
  const auto it = body.find("result");
  if (it == body.end() || !it->is_string())
    throw std::runtime_error("[BrokerClient] malformed execute reply: " + body.dump());
  return it->get<std::string>();
}

bool BrokerClient::disconnect(const std::string& hostname) {
  const auto body = checked(Request{ DisconnectRequest{ hostname } });
  return body.is_boolean() && body.get<bool>();
}

nlohmann::json BrokerClient::status() { return checked(Request{ StatusRequest{} }); }

nlohmann::json BrokerClient::call(const Request& request) { return roundTrip(request.toWire()); }

void BrokerClient::close() {
  std::lock_guard<std::mutex> lock(mtx_);
  socket_.reset();
}

nlohmann::json BrokerClient::checked(const Request& request) {
  auto body = call(request);
  Response reply{ body };
  if (reply.isError())
    rethrow(reply);
  return body;
}

nlohmann::json BrokerClient::roundTrip(const std::string& payload) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!socket_)
    socket_ = std::make_unique<io::StreamSocket>(io::StreamSocket::connectTo(socketPath_, maxFrameBytes_));

  if (!socket_->writeFrame(payload)) {
    socket_.reset();
    throw std::runtime_error("[BrokerClient] write to " + socketPath_ + " failed");
  }
  auto frame = socket_->readFrame(timeout_);
  if (!frame) {
    socket_.reset(); // a late reply would desynchronize the next request
    throw std::runtime_error("[BrokerClient] no reply from " + socketPath_);
  }
  auto reply = Response::fromWire(*frame);
  if (!reply)
    throw std::runtime_error("[BrokerClient] undecodable reply: " + *frame);
  return std::move(reply->body);
}
