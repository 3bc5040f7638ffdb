/* @file EngineConfig.cpp
 * @brief JSON -> EngineConfig conversion with range checks
 *
 * © 2025 ferry contributors — MIT-licensed.
 */

// STL headers
#include <set>

// nlohmann headers
#include <nlohmann/json.hpp>

// ferry headers
#include "core/EngineConfig.hpp"
#include "core/Errors.hpp"

using nlohmann::json;
using namespace ferry::core;

namespace {

  template <typename T> T field(const json& obj, const char* section, const char* key, T fallback) {
    if (!obj.contains(key))
      return fallback;
    try {
      return obj.at(key).get<T>();
    } catch (const json::exception& e) {
      throw ConfigError(std::string("[Config] ") + section + "." + key + ": " + e.what());
    }
  }

  std::string required(const json& obj, const char* section, const char* key) {
    auto value = field<std::string>(obj, section, key, "");
    if (value.empty())
      throw ConfigError(std::string("[Config] ") + section + "." + key + " is required");
    return value;
  }

  ServiceConfig parseService(const json& s) {
    if (!s.is_object())
      throw ConfigError("[Config] 'service' must be an object");

    ServiceConfig cfg;
    cfg.name = field<std::string>(s, "service", "name", "");
    cfg.dataDirectory = required(s, "service", "data_dir");
    cfg.manifestDirectory = required(s, "service", "manifest_dir");
    cfg.endpoint = field<std::string>(s, "service", "endpoint", "");
    cfg.logFile = field<std::string>(s, "service", "log_file", "");
    cfg.debug = field<bool>(s, "service", "debug", false);
    cfg.doubleCheckStaging = field<bool>(s, "service", "double_check_staging", false);

    const auto poll = field<long long>(s, "service", "poll_interval", cfg.pollInterval.count());
    if (poll <= 0)
      throw ConfigError("[Config] service.poll_interval must be positive");
    cfg.pollInterval = std::chrono::milliseconds(poll);

    const auto retention = field<long long>(s, "service", "delete_after", cfg.deleteAfter.count());
    if (retention < 0)
      throw ConfigError("[Config] service.delete_after must not be negative");
    cfg.deleteAfter = std::chrono::seconds(retention);

    cfg.maxPayloadSize = field<double>(s, "service", "max_payload_size", cfg.maxPayloadSize);
    if (cfg.maxPayloadSize <= 0.0)
      throw ConfigError("[Config] service.max_payload_size must be positive");

    const auto capacity = field<long long>(s, "service", "queue_capacity",
                                           static_cast<long long>(cfg.queueCapacity));
    if (capacity <= 0)
      throw ConfigError("[Config] service.queue_capacity must be positive");
    cfg.queueCapacity = static_cast<std::size_t>(capacity);
    return cfg;
  }

  RepositoryConfig parseRepository(const std::string& key, const json& r) {
    if (!r.is_object())
      throw ConfigError("[Config] repositories." + key + " must be an object");

    RepositoryConfig cfg;
    cfg.name = field<std::string>(r, "repository", "name", key);
    cfg.organization = field<std::string>(r, "repository", "organization", "");
    cfg.endpoint = field<std::string>(r, "repository", "endpoint", "");
    cfg.endpoints = field<std::map<std::string, std::string>>(r, "repository", "endpoints", {});
    if (cfg.endpoint.empty() && cfg.endpoints.empty())
      throw ConfigError("[Config] repositories." + key + " has no endpoint");
    return cfg;
  }

} // namespace

const std::string& RepositoryConfig::destinationEndpoint() const {
  if (auto it = endpoints.find("destination"); it != endpoints.end())
    return it->second;
  return endpoint;
}

std::size_t RepositoryConfig::endpointCount() const {
  std::set<std::string> distinct;
  if (!endpoint.empty())
    distinct.insert(endpoint);
  for (const auto& [role, name] : endpoints)
    distinct.insert(name);
  return distinct.size();
}

RepositoryConfig EngineConfig::repository(const std::string& name) const {
  if (auto it = repositories.find(name); it != repositories.end())
    return it->second;
  return {};
}

EngineConfig ferry::core::parseEngineConfig(const json& doc) {
  if (!doc.is_object())
    throw ConfigError("[Config] top level must be an object");
  if (!doc.contains("service"))
    throw ConfigError("[Config] missing 'service' section");

  EngineConfig cfg;
  cfg.service = parseService(doc.at("service"));

  if (doc.contains("repositories")) {
    const auto& repos = doc.at("repositories");
    if (!repos.is_object())
      throw ConfigError("[Config] 'repositories' must be an object");
    for (const auto& [key, value] : repos.items())
      cfg.repositories.emplace(key, parseRepository(key, value));
  }
  return cfg;
}
