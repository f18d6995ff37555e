/* @file Response.cpp
 * @brief reply builders and decoding
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "protocols/Response.hpp"

using namespace devbroker::protocols;

Response Response::success(std::string output) {
  nlohmann::json body = { { "status", "success" }, { "result", std::move(output) } };
  return Response{ std::move(body) };
}

Response Response::error(const std::string& errorType, const std::string& message) {
  nlohmann::json body = { { "status", "error" }, { "error_type", errorType }, { "message", message } };
  return Response{ std::move(body) };
}

bool Response::isError() const {
  return body.is_object() && body.value("status", std::string{}) == "error";
}

std::string Response::errorMessage() const {
  return isError() ? body.value("message", std::string{}) : std::string{};
}

std::string Response::errorType() const {
  return isError() ? body.value("error_type", std::string{}) : std::string{};
}

std::optional<Response> Response::fromWire(const std::string& payload) {
  auto doc = nlohmann::json::parse(payload, nullptr, false);
  if (doc.is_discarded())
    return std::nullopt;
  return Response{ std::move(doc) };
}
