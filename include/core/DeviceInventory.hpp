#pragma once
/** @file  DeviceInventory.hpp
 *  @brief Read-only list of devices the broker may connect to.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace devbroker::core {

  /**
 * @struct DeviceDescriptor
 * @brief Everything needed to open a session to one device.
 *
 *  `command` (optional) spawns a local process that speaks the device CLI
 *  instead of dialling `host:port`; lab simulators are wired in this way.
 */
  struct DeviceDescriptor {
    std::string hostname; ///< unique key
    std::string host;
    std::uint16_t port{ 22 };
    std::string username;
    std::string password;
    std::string platform; ///< hint for the session factory ("iosxe", "nxos", ...)
    std::string command;
    std::string prompt; ///< CLI prompt; empty = "<hostname>#"
    std::chrono::seconds connectTimeout{ 120 };

    std::string effectivePrompt() const { return prompt.empty() ? hostname + "#" : prompt; }
  };

  /**
 * @class DeviceInventory
 * @brief Immutable after construction; lookups are lock-free for that reason.
 */
  class DeviceInventory {
  public:
    DeviceInventory() = default;

    /// Throws `std::invalid_argument` on an empty or duplicate hostname.
    explicit DeviceInventory(std::vector<DeviceDescriptor> devices);

    /**
     * Accepts `{"devices": [ {...}, ... ]}` or `{"devices": {"<hostname>": {...}}}`.
     * Credentials may be literal strings or `{"env": "VAR"}` references.
     * Throws `std::runtime_error` on schema errors.
     */
    static DeviceInventory fromJson(const nlohmann::json& doc);

    /// ConfigLoader + fromJson.
    static DeviceInventory load(const std::string& path);

    const DeviceDescriptor* find(const std::string& hostname) const;
    std::size_t size() const { return devices_.size(); }
    bool empty() const { return devices_.empty(); }
    std::vector<std::string> hostnames() const;
    const std::vector<DeviceDescriptor>& devices() const { return devices_; }

  private:
    std::vector<DeviceDescriptor> devices_;
    std::unordered_map<std::string, std::size_t> index_;
  };

} // namespace devbroker::core
