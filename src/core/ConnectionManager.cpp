/* @file ConnectionManager.cpp
 * @brief session pool: per-device creation lock, global bound, teardown
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <sstream>

// devbroker headers
#include "core/CommandCache.hpp"
#include "core/ConnectAttempt.hpp"
#include "core/ConnectionManager.hpp"
#include "core/DeviceInventory.hpp"
#include "core/Logger.hpp"
#include "core/SessionFactory.hpp"
#include "protocols/DeviceSession.hpp"

using namespace devbroker::core;
using devbroker::protocols::DeviceSession;

namespace {
  constexpr const char* kComponent = "ConnectionManager";

  std::vector<std::string> hintsFor(const DeviceDescriptor& d, ConnectionError::Reason reason) {
    const std::string host = d.host.empty() ? d.command : d.host;
    switch (reason) {
    case ConnectionError::Reason::Authentication:
      return { "Verify the username and password are correct",
               "Check if the user account is locked or disabled",
               "Ensure the user has CLI access permissions on the device" };
    case ConnectionError::Reason::Timeout:
      return { "Device at " + host + " is not responding within the timeout period",
               "Check if the device is powered on and accessible",
               "Consider increasing the device timeout if it is slow to respond" };
    case ConnectionError::Reason::Refused:
      return { "Failed to establish a session to " + host,
               "Verify the device is reachable and its CLI service is running",
               "Check that port " + std::to_string(d.port) + " and the platform '" + d.platform +
                   "' are correct" };
    case ConnectionError::Reason::UnknownDevice:
      return { "The hostname is not part of the broker inventory" };
    case ConnectionError::Reason::Unexpected:
    default:
      return { "An issue with the device configuration",
               "An unsupported device type or firmware version" };
    }
  }
} // namespace

std::string devbroker::core::describeConnectionFailure(const DeviceDescriptor& device,
                                                       ConnectionError::Reason reason,
                                                       const std::string& detail) {
  std::ostringstream out;
  out << toString(reason) << " for device '" << device.hostname << "'\n";
  out << "  Host: " << (device.host.empty() ? device.command : device.host) << "\n";
  if (reason == ConnectionError::Reason::Authentication)
    out << "  Username: " << (device.username.empty() ? "unknown" : device.username) << "\n";
  else
    out << "  Platform: " << (device.platform.empty() ? "unknown" : device.platform) << "\n";
  out << "  Error: " << detail << "\n";
  out << "  Troubleshooting:";
  for (const auto& hint : hintsFor(device, reason))
    out << "\n    - " << hint;
  return out.str();
}

ConnectionManager::ConnectionManager(const DeviceInventory& inventory, const SessionFactory& factory,
                                     CommandCache& cache, std::shared_ptr<ErrorMonitor> errorMonitor,
                                     Logger& logger, std::size_t maxConnections)
    : inventory_(inventory), factory_(factory), cache_(cache),
      errorMonitor_(std::move(errorMonitor)), logger_(logger),
      maxConnections_(std::max<std::size_t>(maxConnections, 1)) {
  if (!errorMonitor_)
    throw std::invalid_argument("[ConnectionManager] error monitor is nullptr");
  logger_.info(kComponent, "initialized with max_connections=" + std::to_string(maxConnections_));
}

ConnectionManager::~ConnectionManager() { shutdownAll(); }

std::shared_ptr<DeviceSession> ConnectionManager::acquire(const std::string& hostname) {
  return acquireSession(hostname, true);
}

std::shared_ptr<DeviceSession> ConnectionManager::tryAcquire(const std::string& hostname) {
  return acquireSession(hostname, false);
}

std::shared_ptr<DeviceSession> ConnectionManager::acquireSession(const std::string& hostname,
                                                                 bool wait) {
  const DeviceDescriptor* device = inventory_.find(hostname);
  if (device == nullptr)
    throw ConnectionError("[ConnectionManager] unknown device: " + hostname,
                          ConnectionError::Reason::UnknownDevice);
  if (shuttingDown_)
    throw ConnectionError("[ConnectionManager] broker is shutting down");

  if (auto existing = findSession(hostname); existing && healthCheck(*existing))
    return existing;

  std::lock_guard<std::mutex> creation(creationLock(hostname));

  // another caller may have finished creating while we waited for the lock
  if (auto existing = findSession(hostname)) {
    if (healthCheck(*existing)) {
      logger_.debug(kComponent, "reusing existing session for " + hostname);
      return existing;
    }
    logger_.warning(kComponent, "removing unhealthy session for " + hostname);
    release(hostname, existing);
  }

  if (!acquireSlot(hostname, wait))
    return nullptr;
  logger_.info(kComponent, "creating session to " + hostname +
                               (device->host.empty() ? std::string{} : " at " + device->host));

  std::shared_ptr<DeviceSession> session = createSession(*device);

  {
    std::lock_guard<std::mutex> lock(tableMtx_);
    if (!shuttingDown_) {
      sessions_[hostname] = session;
      logger_.info(kComponent, "connected to " + hostname);
      return session;
    }
  }

  closeQuietly(hostname, *session);
  releaseSlot();
  throw ConnectionError("[ConnectionManager] broker is shutting down");
}

// Runs the factory with a registered ConnectAttempt; the caller holds a slot,
// which is given back here on every failure path.
std::shared_ptr<DeviceSession> ConnectionManager::createSession(const DeviceDescriptor& device) {
  auto attempt = std::make_shared<ConnectAttempt>(device.hostname);
  bool registered = false;
  {
    std::lock_guard<std::mutex> lock(tableMtx_);
    if (!shuttingDown_) {
      attempts_.push_back(attempt);
      registered = true;
    }
  }
  if (!registered) {
    releaseSlot();
    throw ConnectionError("[ConnectionManager] broker is shutting down");
  }
  std::shared_ptr<DeviceSession> session;
  ConnectionError::Reason reason = ConnectionError::Reason::Unexpected;
  std::string detail;
  try {
    session = factory_.create(device, *attempt);
  } catch (const ConnectionError& e) {
    reason = e.reason();
    detail = e.what();
  } catch (const std::exception& e) {
    detail = e.what();
  }
  {
    std::lock_guard<std::mutex> lock(tableMtx_);
    attempts_.erase(std::remove(attempts_.begin(), attempts_.end(), attempt), attempts_.end());
  }

  if (attempt->cancelled()) {
    if (session)
      closeQuietly(device.hostname, *session);
    releaseSlot();
    logger_.debug(kComponent, "connect to " + device.hostname + " cancelled by shutdown");
    throw ConnectionError("[ConnectionManager] broker is shutting down");
  }
  if (!session) {
    releaseSlot();
    failConnect(device, reason, detail.empty() ? "session factory returned no session" : detail);
  }
  return session;
}

bool ConnectionManager::healthCheck(DeviceSession& session) const {
  try {
    return session.isHealthy();
  } catch (const std::exception& e) {
    logger_.warning(kComponent, std::string("health check threw: ") + e.what());
    return false;
  }
}

void ConnectionManager::release(const std::string& hostname) {
  std::shared_ptr<DeviceSession> session;
  {
    std::lock_guard<std::mutex> lock(tableMtx_);
    auto it = sessions_.find(hostname);
    if (it != sessions_.end()) {
      session = std::move(it->second);
      sessions_.erase(it);
    }
  }
  dropSession(hostname, std::move(session));
}

bool ConnectionManager::release(const std::string& hostname,
                                const std::shared_ptr<DeviceSession>& session) {
  {
    std::lock_guard<std::mutex> lock(tableMtx_);
    auto it = sessions_.find(hostname);
    if (it == sessions_.end() || it->second != session) {
      logger_.debug(kComponent, "session for " + hostname + " already replaced, nothing to release");
      return false;
    }
    sessions_.erase(it);
  }
  dropSession(hostname, session);
  return true;
}

bool ConnectionManager::cacheOutput(const std::string& hostname,
                                    const std::shared_ptr<DeviceSession>& session,
                                    const std::string& command, const std::string& output) {
  // release() erases under tableMtx_ before it clears the cache
  std::lock_guard<std::mutex> lock(tableMtx_);
  auto it = sessions_.find(hostname);
  if (it == sessions_.end() || it->second != session)
    return false;
  cache_.set(hostname, command, output);
  return true;
}

void ConnectionManager::dropSession(const std::string& hostname,
                                    std::shared_ptr<DeviceSession> session) {
  // cached output belongs to the old session either way
  cache_.clear(hostname);
  if (!session)
    return;

  closeQuietly(hostname, *session);
  releaseSlot();
  logger_.info(kComponent, "released session for " + hostname);
}

void ConnectionManager::shutdownAll() {
  {
    std::lock_guard<std::mutex> lock(slotMtx_);
    shuttingDown_ = true;
  }
  slotCv_.notify_all();

  std::unordered_map<std::string, std::shared_ptr<DeviceSession>> doomed;
  std::vector<std::shared_ptr<ConnectAttempt>> inFlight;
  {
    std::lock_guard<std::mutex> lock(tableMtx_);
    doomed.swap(sessions_);
    inFlight = attempts_;
  }
  if (!inFlight.empty())
    logger_.info(kComponent, "cancelling " + std::to_string(inFlight.size()) +
                                 " connects in progress");
  for (auto& attempt : inFlight)
    attempt->cancel();
  if (doomed.empty())
    return;

  logger_.info(kComponent, "closing " + std::to_string(doomed.size()) + " active sessions");
  for (auto& [hostname, session] : doomed) {
    closeQuietly(hostname, *session);
    cache_.clear(hostname);
    releaseSlot();
  }
}

bool ConnectionManager::isConnected(const std::string& hostname) const {
  std::lock_guard<std::mutex> lock(tableMtx_);
  return sessions_.count(hostname) > 0;
}

std::vector<std::string> ConnectionManager::connectedDevices() const {
  std::vector<std::string> names;
  {
    std::lock_guard<std::mutex> lock(tableMtx_);
    names.reserve(sessions_.size());
    for (const auto& [hostname, session] : sessions_)
      names.push_back(hostname);
  }
  std::sort(names.begin(), names.end());
  return names;
}

std::size_t ConnectionManager::liveSessions() const {
  std::lock_guard<std::mutex> lock(tableMtx_);
  return sessions_.size();
}

ConnectionManager::Stats ConnectionManager::stats() const {
  std::vector<std::shared_ptr<DeviceSession>> snapshot;
  {
    std::lock_guard<std::mutex> lock(tableMtx_);
    snapshot.reserve(sessions_.size());
    for (const auto& [hostname, session] : sessions_)
      snapshot.push_back(session);
  }

  Stats s;
  s.maxConnections = maxConnections_;
  s.activeConnections = snapshot.size();
  for (const auto& session : snapshot) {
    if (healthCheck(*session))
      ++s.healthyConnections;
  }
  {
    std::lock_guard<std::mutex> lock(slotMtx_);
    s.availableSlots = maxConnections_ - std::min(slotsInUse_, maxConnections_);
  }
  return s;
}

std::shared_ptr<DeviceSession> ConnectionManager::findSession(const std::string& hostname) const {
  std::lock_guard<std::mutex> lock(tableMtx_);
  auto it = sessions_.find(hostname);
  return it == sessions_.end() ? nullptr : it->second;
}

std::mutex& ConnectionManager::creationLock(const std::string& hostname) {
  std::lock_guard<std::mutex> lock(tableMtx_);
  auto& slot = creationLocks_[hostname];
  if (!slot)
    slot = std::make_unique<std::mutex>();
  return *slot;
}

bool ConnectionManager::acquireSlot(const std::string& hostname, bool wait) {
  std::unique_lock<std::mutex> lock(slotMtx_);
  if (slotsInUse_ >= maxConnections_ && !shuttingDown_) {
    if (!wait) {
      logger_.debug(kComponent, "connection limit reached, " + hostname + " deferred");
      return false;
    }
    logger_.debug(kComponent, "connection limit reached, " + hostname + " waits for a free slot");
  }
  slotCv_.wait(lock, [this] { return shuttingDown_ || slotsInUse_ < maxConnections_; });
  if (shuttingDown_)
    throw ConnectionError("[ConnectionManager] broker is shutting down");
  ++slotsInUse_;
  return true;
}

void ConnectionManager::releaseSlot() {
  {
    std::lock_guard<std::mutex> lock(slotMtx_);
    if (slotsInUse_ > 0)
      --slotsInUse_;
  }
  slotCv_.notify_one();
  if (slotReleasedHook_)
    slotReleasedHook_();
}

void ConnectionManager::closeQuietly(const std::string& hostname, DeviceSession& session) const {
  try {
    session.close();
  } catch (const std::exception& e) {
    // the session is gone from the table either way
    logger_.error(kComponent, "error closing session for " + hostname + ": " + e.what());
  }
}

void ConnectionManager::failConnect(const DeviceDescriptor& device, ConnectionError::Reason reason,
                                    const std::string& detail) {
  std::string message = describeConnectionFailure(device, reason, detail);
  logger_.debug(kComponent, "connect to " + device.hostname + " failed: " + detail);
  errorMonitor_->notifyFailure(message); // escalation logs each unique failure once
  throw ConnectionError(message, reason);
}
