#pragma once
/** @file  SnapshotStore.hpp
 *  @brief Versioned JSON snapshot of the transfer table plus adapter state.
 *
 *  © 2025 ferry contributors — MIT-licensed.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "model/Transfer.hpp"

namespace ferry::core {

  struct Snapshot {
    std::vector<model::Transfer> transfers;
    std::vector<std::pair<std::string, std::vector<std::uint8_t>>> repositoryStates;
  };

  /**
 * @class SnapshotStore
 * @brief Reads and atomically replaces one snapshot file.
 *
 *  * `load()` -> nullopt when there is no readable file (fresh start).
 *  * Unparsable content, a foreign schema or another version throws
 *    `SnapshotCorruptError`; I/O failures on save throw `SnapshotError`.
 */
  class SnapshotStore {
  public:
    static constexpr const char* kSchema = "ferry-snapshot";
    static constexpr int kVersion = 1;

    explicit SnapshotStore(std::string path);

    /// `<dataDir>/ferry-<serviceName>.json`, or `<dataDir>/ferry.json` without a name.
    static std::string fileFor(const std::string& dataDir, const std::string& serviceName);

    static std::string encode(const Snapshot& snapshot);
    static Snapshot decode(const std::string& text);

    std::optional<Snapshot> load() const;
    void save(const Snapshot& snapshot) const;

    /// Moves a bad snapshot aside to `<path>.corrupt`; returns the new name.
    std::string quarantine() const;

    const std::string& path() const { return path_; }

  private:
    std::string path_;
  };

} // namespace ferry::core
