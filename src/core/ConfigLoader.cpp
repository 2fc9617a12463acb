/* @file ConfigLoader.cpp
 * @brief JSON -> HotspotConfig mapping and validation
 *
 * © 2026 hotspot-toggle contributors — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <utility>

// third party
#include <nlohmann/json.hpp>

// Hotspot headers
#include "core/ConfigLoader.hpp"

using json = nlohmann::json;
using namespace hotspot::core;

namespace {

  const json* section(const json& doc, const char* key) {
    auto it = doc.find(key);
    if (it == doc.end())
      return nullptr;
    if (!it->is_object())
      throw std::invalid_argument(std::string("[ConfigLoader] '") + key + "' must be an object");
    return &*it;
  }

  template <typename T> void readInto(const json* obj, const char* key, T& out) {
    if (!obj)
      return;
    auto it = obj->find(key);
    if (it == obj->end())
      return;
    try {
      out = it->get<T>();
    } catch (const json::exception& e) {
      throw std::invalid_argument(std::string("[ConfigLoader] bad value for '") + key + "': " + e.what());
    }
  }

  // fractions and values outside T are rejected, never narrowed
  template <typename T> void readInteger(const json* obj, const char* key, T& out) {
    if (!obj)
      return;
    auto it = obj->find(key);
    if (it == obj->end())
      return;
    if (!it->is_number_integer())
      throw std::invalid_argument(std::string("[ConfigLoader] '") + key + "' must be an integer");

    bool inRange = false;
    if (it->is_number_unsigned()) {
      inRange = it->get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<T>::max());
    } else {
      const auto v = it->get<std::int64_t>();
      inRange = v >= std::numeric_limits<T>::min() && v <= std::numeric_limits<T>::max();
    }
    if (!inRange)
      throw std::invalid_argument(std::string("[ConfigLoader] '") + key + "' is out of range");
    out = it->get<T>();
  }

  void readMillis(const json* obj, const char* key, std::chrono::milliseconds& out) {
    long long ms = out.count();
    readInteger(obj, key, ms);
    if (ms < 0)
      throw std::invalid_argument(std::string("[ConfigLoader] '") + key + "' must be >= 0");
    out = std::chrono::milliseconds{ ms };
  }

} // namespace

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open " + path_);

  try {
    return json::parse(in);
  } catch (const json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] " + path_ + ": " + e.what());
  }
}

HotspotConfig ConfigLoader::loadConfig() const { return fromJson(load()); }

RadioCyclePolicy ConfigLoader::parsePolicy(const std::string& name) {
  if (name == "tethering-dance")
    return RadioCyclePolicy::TetheringDance;
  if (name == "power-cycle")
    return RadioCyclePolicy::PowerCycle;
  throw std::invalid_argument("[ConfigLoader] unknown radio cycle policy: " + name);
}

Severity ConfigLoader::parseSeverity(const std::string& name) {
  if (name == "debug")
    return Severity::Debug;
  if (name == "info")
    return Severity::Info;
  if (name == "warning")
    return Severity::Warning;
  if (name == "error")
    return Severity::Error;
  throw std::invalid_argument("[ConfigLoader] unknown severity: " + name);
}

HotspotConfig ConfigLoader::fromJson(const json& doc) {
  if (!doc.is_object())
    throw std::invalid_argument("[ConfigLoader] top level must be an object");

  HotspotConfig cfg;

  const json* adapter = section(doc, "adapter");
  readInto(adapter, "name", cfg.adapter.name);
  readInto(adapter, "description", cfg.adapter.description);

  const json* hotspot = section(doc, "hotspot");
  readInto(hotspot, "connectionName", cfg.hotspot.connectionName);
  readInto(hotspot, "ssid", cfg.hotspot.ssid);
  readInto(hotspot, "password", cfg.hotspot.password);
  if (cfg.hotspot.connectionName.empty())
    throw std::invalid_argument("[ConfigLoader] hotspot.connectionName must not be empty");
  if (!cfg.hotspot.password.empty() &&
      (cfg.hotspot.password.size() < 8 || cfg.hotspot.password.size() > 63))
    throw std::invalid_argument("[ConfigLoader] hotspot.password must be 8-63 characters");

  const json* wait = section(doc, "profileWait");
  readInteger(wait, "maxAttempts", cfg.profileWait.maxAttempts);
  readMillis(wait, "intervalMs", cfg.profileWait.interval);
  if (cfg.profileWait.maxAttempts < 1)
    throw std::invalid_argument("[ConfigLoader] profileWait.maxAttempts must be >= 1");

  const json* cycle = section(doc, "radioCycle");
  std::string policy = toString(cfg.radioCycle.policy);
  readInto(cycle, "policy", policy);
  cfg.radioCycle.policy = parsePolicy(policy);
  readMillis(cycle, "settleMs", cfg.radioCycle.settle);
  readMillis(cycle, "offDelayMs", cfg.radioCycle.offDelay);
  readMillis(cycle, "onSettleMs", cfg.radioCycle.onSettle);
  readInto(cycle, "restartAdapter", cfg.radioCycle.restartAdapter);
  readMillis(cycle, "adapterRestartSettleMs", cfg.radioCycle.adapterRestartSettle);

  const json* logging = section(doc, "logging");
  readInto(logging, "file", cfg.logFile);
  std::string severity = "info";
  readInto(logging, "minSeverity", severity);
  cfg.minSeverity = parseSeverity(severity);

  const json* notifications = section(doc, "notifications");
  readInto(notifications, "enabled", cfg.notificationsEnabled);

  return cfg;
}
