#pragma once
/** @file  Transfer.hpp
 *  @brief Client-visible aggregate of the tasks created from one specification.
 *
 *  © 2025 ferry contributors — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <boost/uuid/uuid.hpp>

#include "model/Instructions.hpp"
#include "model/Specification.hpp"
#include "model/Task.hpp"
#include "model/TransferStatus.hpp"

namespace ferry::model {

  using TransferId = boost::uuids::uuid;
  using Clock = std::chrono::system_clock;

  std::string toString(const TransferId& id);

  /// `YYYY-MM-DDTHH:MM:SSZ` (UTC).
  std::string toRfc3339(Clock::time_point t);

  /**
 * @struct Transfer
 * @brief Owns its tasks; `status` is derived from them via refreshStatus().
 *
 *  * `canceled` is sticky: set by the engine, never cleared.
 *  * `manifestId` is assigned once manifest generation starts.
 */
  struct Transfer {
    TransferId id{};
    Specification spec;
    Instructions instructions;
    std::vector<Task> tasks;
    TransferStatus status;
    bool canceled{ false };
    Clock::time_point created{};
    Clock::time_point completed{};
    std::string destinationFolder;
    std::optional<TransferId> manifestId{};
    std::string manifestFile;
    std::optional<std::string> manifestHandle{}; ///< delivery copy in flight
    std::uint64_t payloadBytes{ 0 };

    bool isTerminal() const { return model::isTerminal(status.code); }

    /// Every task finished copying and unpacking; only the manifest is missing.
    bool readyForManifest() const;

    /// Recomputes `status` from the tasks.
    void refreshStatus();
  };

  /**
   * Succeeded iff every task succeeded, Failed iff any task failed (message
   * of the first failed task), otherwise the least advanced task code.
   * File counts are summed over all tasks.
   */
  TransferStatus aggregateStatus(const std::vector<Task>& tasks);

} // namespace ferry::model
