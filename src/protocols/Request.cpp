/* @file Request.cpp
 * @brief request decoding / encoding
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// third-party
#include <nlohmann/json.hpp>

// devbroker headers
#include "core/Errors.hpp"
#include "protocols/Request.hpp"

using namespace devbroker::protocols;
using devbroker::core::ProtocolError;
using devbroker::core::UnknownCommandError;

namespace {

  std::string requireString(const nlohmann::json& doc, const char* key, const std::string& tag) {
    auto it = doc.find(key);
    if (it == doc.end())
      throw ProtocolError("'" + tag + "' request is missing '" + key + "'");
    if (!it->is_string())
      throw ProtocolError("'" + tag + "' request field '" + key + "' must be a string");
    auto value = it->get<std::string>();
    if (value.empty())
      throw ProtocolError("'" + tag + "' request field '" + key + "' must not be empty");
    return value;
  }

} // namespace

const char* Request::name() const {
  return std::visit(overloaded{
                        [](const PingRequest&) { return "ping"; },
                        [](const ConnectRequest&) { return "connect"; },
                        [](const ExecuteRequest&) { return "execute"; },
                        [](const DisconnectRequest&) { return "disconnect"; },
                        [](const StatusRequest&) { return "status"; },
                    },
                    body);
}

std::string Request::toWire() const {
  nlohmann::json doc;
  doc["command"] = name();
  std::visit(overloaded{
                 [](const PingRequest&) {},
                 [&doc](const ConnectRequest& r) { doc["hostname"] = r.hostname; },
                 [&doc](const ExecuteRequest& r) {
                   doc["hostname"] = r.hostname;
                   doc["cmd"] = r.command;
                 },
                 [&doc](const DisconnectRequest& r) { doc["hostname"] = r.hostname; },
                 [](const StatusRequest&) {},
             },
             body);
  return doc.dump();
}

Request Request::fromWire(const std::string& payload) {
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(payload);
  } catch (const nlohmann::json::parse_error& e) {
    throw ProtocolError(std::string("invalid JSON: ") + e.what());
  }

  if (!doc.is_object())
    throw ProtocolError("request must be a JSON object");
  auto tagIt = doc.find("command");
  if (tagIt == doc.end() || !tagIt->is_string())
    throw ProtocolError("request is missing a string 'command' field");

  const auto tag = tagIt->get<std::string>();
  if (tag == "ping")
    return Request{ PingRequest{} };
  if (tag == "connect")
    return Request{ ConnectRequest{ requireString(doc, "hostname", tag) } };
  if (tag == "execute") {
    auto hostname = requireString(doc, "hostname", tag);
    return Request{ ExecuteRequest{ std::move(hostname), requireString(doc, "cmd", tag) } };
  }
  if (tag == "disconnect")
    return Request{ DisconnectRequest{ requireString(doc, "hostname", tag) } };
  if (tag == "status")
    return Request{ StatusRequest{} };

  throw UnknownCommandError("Unknown command: " + tag);
}
