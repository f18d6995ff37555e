#pragma once
/** @file  SessionFactory.hpp
 *  @brief Runtime registry that maps platform hints to session creators.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace devbroker::protocols {
  class DeviceSession;
}

namespace devbroker::core {

  class ConnectAttempt;
  struct DeviceDescriptor;

  /// Platform key used for descriptors that carry a `command`.
  inline constexpr const char* kProcessPlatform = "process";

  /**
 * @class SessionFactory
 * @brief Register & instantiate device sessions by platform hint.
 *
 *  * Keeps ConnectionManager decoupled from concrete transports.
 *  * Creators return a connected session or throw (ideally `ConnectionError`).
 *  * Creators must honour the `ConnectAttempt`: a cancelled attempt ends the
 *    connect promptly with an exception.
 *  * Descriptors with a `command` always go to the "process" creator.
 */
  class SessionFactory {
  public:
    using Creator =
        std::function<std::shared_ptr<protocols::DeviceSession>(const DeviceDescriptor&,
                                                                 ConnectAttempt&)>;

    virtual ~SessionFactory() = default;

    /// Register a creator under \p platform.  Returns false on duplicate.
    bool registerPlatform(const std::string& platform, Creator maker);

    /// Creator used when no platform-specific one matches.
    void setFallback(Creator maker);

    bool supports(const DeviceDescriptor& device) const;

    /// Establish a new session or throw `ConnectionError` if nothing can serve it.
    virtual std::shared_ptr<protocols::DeviceSession> create(const DeviceDescriptor& device,
                                                             ConnectAttempt& attempt) const;

    /// create() with an attempt nobody cancels.
    std::shared_ptr<protocols::DeviceSession> create(const DeviceDescriptor& device) const;

  private:
    const Creator* lookup(const DeviceDescriptor& device) const;

    std::unordered_map<std::string, Creator> creators_;
    Creator fallback_;
  };

} // namespace devbroker::core
