/* @file CommandCache.cpp
 * @brief TTL cache with read-triggered expiry
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>

#include "core/CommandCache.hpp"

using namespace devbroker::core;

CommandCache::CommandCache(std::chrono::seconds ttl, NowFn now)
    : ttl_(ttl), now_(now ? std::move(now) : NowFn(&Clock::now)) {}

std::optional<std::string> CommandCache::get(const std::string& hostname,
                                             const std::string& command) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto device = entries_.find(hostname);
  if (device == entries_.end())
    return std::nullopt;

  auto entry = device->second.find(command);
  if (entry == device->second.end())
    return std::nullopt;

  if (isFresh(entry->second, now_()))
    return entry->second.output;

  device->second.erase(entry);
  if (device->second.empty())
    entries_.erase(device);
  return std::nullopt;
}

void CommandCache::set(const std::string& hostname, const std::string& command,
                       std::string output) {
  const auto now = now_();
  std::lock_guard<std::mutex> lock(mtx_);
  entries_[hostname].insert_or_assign(command, Entry{ std::move(output), now });
}

void CommandCache::clear(const std::string& hostname) {
  std::lock_guard<std::mutex> lock(mtx_);
  entries_.erase(hostname);
}

CommandCache::Stats CommandCache::stats(const std::string& hostname) const {
  Stats s;
  const auto now = now_();
  std::lock_guard<std::mutex> lock(mtx_);
  auto device = entries_.find(hostname);
  if (device == entries_.end())
    return s;

  for (const auto& [command, entry] : device->second) {
    ++s.total;
    if (isFresh(entry, now))
      ++s.valid;
    else
      ++s.expired;
  }
  return s;
}

std::vector<std::string> CommandCache::devicesWithCache() const {
  std::vector<std::string> names;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    names.reserve(entries_.size());
    for (const auto& [hostname, commands] : entries_) {
      if (!commands.empty())
        names.push_back(hostname);
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

std::size_t CommandCache::totalEntries() const {
  std::lock_guard<std::mutex> lock(mtx_);
  std::size_t total = 0;
  for (const auto& [hostname, commands] : entries_)
    total += commands.size();
  return total;
}
