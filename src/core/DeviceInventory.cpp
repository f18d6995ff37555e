/* @file DeviceInventory.cpp
 * @brief inventory parsing and lookup
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdlib>
#include <stdexcept>

// third-party
#include <nlohmann/json.hpp>

// devbroker headers
#include "core/ConfigLoader.hpp"
#include "core/DeviceInventory.hpp"

namespace devbroker::core {

  namespace {

    constexpr long long kMaxTimeoutSeconds = 86400; // keeps poll() timeouts within int milliseconds

    std::string fieldContext(const std::string& hostname, const char* key) {
      return "[DeviceInventory] device '" + hostname + "' field '" + key + "'";
    }

    std::string readText(const nlohmann::json& entry, const std::string& hostname, const char* key) {
      if (!entry.contains(key) || entry.at(key).is_null())
        return {};
      const auto& value = entry.at(key);
      if (!value.is_string())
        throw std::runtime_error(fieldContext(hostname, key) + " must be a string");
      return value.get<std::string>();
    }

    // credential reference: literal string or {"env": "NAME"}
    std::string readCredential(const nlohmann::json& entry, const std::string& hostname,
                               const char* key) {
      if (!entry.contains(key) || !entry.at(key).is_object())
        return readText(entry, hostname, key);

      const auto& ref = entry.at(key);
      if (!ref.contains("env") || !ref.at("env").is_string())
        throw std::runtime_error(fieldContext(hostname, key) + " reference needs an 'env' name");
      const auto var = ref.at("env").get<std::string>();
      const char* value = std::getenv(var.c_str());
      if (value == nullptr)
        throw std::runtime_error(fieldContext(hostname, key) + " references unset variable " + var);
      return value;
    }

    DeviceDescriptor parseDevice(const nlohmann::json& entry, std::string hostname) {
      if (!entry.is_object())
        throw std::runtime_error("[DeviceInventory] device entries must be objects");
      if (hostname.empty())
        hostname = readText(entry, hostname, "hostname");
      if (hostname.empty())
        throw std::runtime_error("[DeviceInventory] device entry without 'hostname'");

      DeviceDescriptor d;
      d.hostname = hostname;
      d.host = readText(entry, hostname, "host");
      d.command = readText(entry, hostname, "command");
      if (d.host.empty() && d.command.empty())
        throw std::runtime_error("[DeviceInventory] device '" + hostname +
                                 "' needs either 'host' or 'command'");

      if (entry.contains("port")) {
        const auto& port = entry.at("port");
        // read wide so out-of-range values cannot wrap into range
        const long long value = port.is_number_integer() ? port.get<long long>() : 0;
        if (value <= 0 || value > 65535)
          throw std::runtime_error(fieldContext(hostname, "port") + " must be 1..65535");
        d.port = static_cast<std::uint16_t>(value);
      }

      d.username = readCredential(entry, hostname, "username");
      d.password = readCredential(entry, hostname, "password");
      d.platform = readText(entry, hostname, "platform");
      if (d.platform.empty())
        d.platform = readText(entry, hostname, "os");
      d.prompt = readText(entry, hostname, "prompt");

      if (entry.contains("timeout")) {
        const auto& timeout = entry.at("timeout");
        const long long value = timeout.is_number_integer() ? timeout.get<long long>() : 0;
        if (value <= 0 || value > kMaxTimeoutSeconds)
          throw std::runtime_error(fieldContext(hostname, "timeout") + " must be 1.." +
                                   std::to_string(kMaxTimeoutSeconds) + " seconds");
        d.connectTimeout = std::chrono::seconds(value);
      }
      return d;
    }

  } // namespace

  DeviceInventory::DeviceInventory(std::vector<DeviceDescriptor> devices)
      : devices_(std::move(devices)) {
    index_.reserve(devices_.size());
    for (std::size_t i = 0; i < devices_.size(); ++i) {
      const auto& name = devices_[i].hostname;
      if (name.empty())
        throw std::invalid_argument("[DeviceInventory] empty hostname");
      if (!index_.emplace(name, i).second)
        throw std::invalid_argument("[DeviceInventory] duplicate hostname: " + name);
    }
  }

  DeviceInventory DeviceInventory::fromJson(const nlohmann::json& doc) {
    if (!doc.is_object() || !doc.contains("devices"))
      throw std::runtime_error("[DeviceInventory] inventory must be an object with 'devices'");

    const auto& list = doc.at("devices");
    std::vector<DeviceDescriptor> devices;
    if (list.is_array()) {
      for (const auto& entry : list)
        devices.push_back(parseDevice(entry, {}));
    } else if (list.is_object()) {
      for (const auto& [name, entry] : list.items())
        devices.push_back(parseDevice(entry, name));
    } else {
      throw std::runtime_error("[DeviceInventory] 'devices' must be an array or an object");
    }

    try {
      return DeviceInventory(std::move(devices));
    } catch (const std::invalid_argument& e) {
      throw std::runtime_error(e.what());
    }
  }

  DeviceInventory DeviceInventory::load(const std::string& path) {
    return fromJson(ConfigLoader(path).load());
  }

  const DeviceDescriptor* DeviceInventory::find(const std::string& hostname) const {
    auto it = index_.find(hostname);
    return it == index_.end() ? nullptr : &devices_[it->second];
  }

  std::vector<std::string> DeviceInventory::hostnames() const {
    std::vector<std::string> names;
    names.reserve(devices_.size());
    for (const auto& d : devices_)
      names.push_back(d.hostname);
    return names;
  }

} // namespace devbroker::core
