#pragma once
/** @file  TransferStatus.hpp
 *  @brief Status codes shared by tasks, transfers and transport endpoints.
 *
 *  © 2025 ferry contributors — MIT-licensed.
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace ferry {
  namespace model {

    enum class StatusCode : std::uint8_t {
      Unknown,
      Staging,
      Active,
      Inactive,
      Finalizing,
      Succeeded,
      Failed,
      Count
    };
    static_assert(static_cast<std::uint8_t>(StatusCode::Count) == 7,
                  "StatusCode changed please update toString() and progressRank()");

    inline const char* toString(StatusCode c) {
      switch (c) {
      case StatusCode::Unknown:
        return "Unknown";
      case StatusCode::Staging:
        return "Staging";
      case StatusCode::Active:
        return "Active";
      case StatusCode::Inactive:
        return "Inactive";
      case StatusCode::Finalizing:
        return "Finalizing";
      case StatusCode::Succeeded:
        return "Succeeded";
      case StatusCode::Failed:
        return "Failed";
      default:
        return "Unknown";
      }
    }

    inline bool isTerminal(StatusCode c) {
      return c == StatusCode::Succeeded || c == StatusCode::Failed;
    }

    /// Ordering used to report the slowest task of a transfer (Unknown sorts first).
    inline int progressRank(StatusCode c) {
      switch (c) {
      case StatusCode::Unknown:
        return 0;
      case StatusCode::Staging:
        return 1;
      case StatusCode::Active:
        return 2;
      case StatusCode::Inactive:
        return 3;
      case StatusCode::Finalizing:
        return 4;
      default:
        return 5;
      }
    }

    /// Value type reported to clients and by transport endpoints.
    struct TransferStatus {
      StatusCode code{ StatusCode::Unknown };
      std::string message{};
      std::size_t numFiles{ 0 };
      std::size_t numFilesTransferred{ 0 };

      bool operator==(const TransferStatus&) const = default;
    };

    /// Staging progress as reported by a repository.
    enum class StagingStatus : std::uint8_t { Unknown, Active, Succeeded, Failed };

    inline const char* toString(StagingStatus s) {
      switch (s) {
      case StagingStatus::Active:
        return "Active";
      case StagingStatus::Succeeded:
        return "Succeeded";
      case StagingStatus::Failed:
        return "Failed";
      default:
        return "Unknown";
      }
    }

  } // namespace model
} // namespace ferry
