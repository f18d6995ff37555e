/* @file SessionFactory.cpp
 * @brief platform → session creator lookup
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/SessionFactory.hpp"
#include "core/ConnectAttempt.hpp"
#include "core/DeviceInventory.hpp"
#include "core/Errors.hpp"
#include "protocols/DeviceSession.hpp"

using namespace devbroker::core;

bool SessionFactory::registerPlatform(const std::string& platform, Creator maker) {
  return creators_.emplace(platform, std::move(maker)).second;
}

void SessionFactory::setFallback(Creator maker) { fallback_ = std::move(maker); }

bool SessionFactory::supports(const DeviceDescriptor& device) const {
  return lookup(device) != nullptr;
}

std::shared_ptr<devbroker::protocols::DeviceSession>
SessionFactory::create(const DeviceDescriptor& device, ConnectAttempt& attempt) const {
  const Creator* maker = lookup(device);
  if (maker == nullptr) {
    const std::string platform = device.platform.empty() ? "<none>" : device.platform;
    throw ConnectionError("[SessionFactory] no session backend for platform '" + platform +
                              "' (device " + device.hostname + ")",
                          ConnectionError::Reason::Refused);
  }
  return (*maker)(device, attempt);
}

std::shared_ptr<devbroker::protocols::DeviceSession>
SessionFactory::create(const DeviceDescriptor& device) const {
  ConnectAttempt attempt(device.hostname);
  return create(device, attempt);
}

const SessionFactory::Creator* SessionFactory::lookup(const DeviceDescriptor& device) const {
  const std::string key = device.command.empty() ? device.platform : kProcessPlatform;
  if (auto it = creators_.find(key); it != creators_.end())
    return &it->second;
  return fallback_ ? &fallback_ : nullptr;
}
