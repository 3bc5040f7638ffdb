#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads run-time configuration (JSON) from the host FS.
 *
 *  © 2025 ferry contributors — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

namespace ferry::core {

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file, expands `${VAR}` references from
 *        the environment, and hands the parsed object to the caller.
 *
 *  * No caching: every call to `load()` re-reads the file.
 *  * All schema validation lives in the calling layer (parseEngineConfig).
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `std::runtime_error`.
    nlohmann::json load() const;

    /// Replaces `${NAME}` with the value of environment variable NAME ("" if unset).
    static std::string expandEnvironment(const std::string& text);

  private:
    std::string path_;
  };

} // namespace ferry::core
