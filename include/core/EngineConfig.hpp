#pragma once
/** @file  EngineConfig.hpp
 *  @brief Typed, validated view of the ferry configuration file.
 *
 *  © 2025 ferry contributors — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <map>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace ferry::core {

  struct ServiceConfig {
    std::string name;                                   ///< scopes snapshot / journal names
    std::chrono::milliseconds pollInterval{ 60000 };
    std::string dataDirectory;
    std::string manifestDirectory;
    std::chrono::seconds deleteAfter{ 7 * 24 * 3600 };  ///< retention of terminal transfers
    std::string endpoint;                               ///< local endpoint for manifest delivery
    double maxPayloadSize{ 100.0 };                     ///< GB
    bool doubleCheckStaging{ false };
    std::size_t queueCapacity{ 32 };
    std::string logFile;
    bool debug{ false };
  };

  struct RepositoryConfig {
    std::string name;
    std::string organization;
    std::string endpoint;                         ///< default endpoint
    std::map<std::string, std::string> endpoints; ///< named endpoints ("destination", ...)

    /// Endpoint used when files arrive at this repository.
    const std::string& destinationEndpoint() const;

    /// Distinct endpoints this repository serves files from.
    std::size_t endpointCount() const;
  };

  struct EngineConfig {
    ServiceConfig service;
    std::map<std::string, RepositoryConfig> repositories;

    /// Config of repository \p name, or a default-constructed one if absent.
    RepositoryConfig repository(const std::string& name) const;
  };

  /// Convert + validate a parsed config document; throws `ConfigError`.
  EngineConfig parseEngineConfig(const nlohmann::json& doc);

} // namespace ferry::core
