#pragma once
/** @file  Task.hpp
 *  @brief One (source endpoint, destination endpoint) unit of work inside a transfer.
 *
 *  © 2025 ferry contributors — MIT-licensed.
 */

#include <optional>
#include <string>
#include <vector>

#include "model/Resource.hpp"
#include "model/TransferStatus.hpp"

namespace ferry::model {

  /// Where a task's files come from and go to. Fixed at scatter time.
  struct TaskRoute {
    std::string source;      ///< repository
    std::string destination; ///< repository
    std::string sourceEndpoint;
    std::string destinationEndpoint;

    bool operator==(const TaskRoute&) const = default;
  };

  /**
 * @class Task
 * @brief Owned by exactly one Transfer; only the progress fields mutate.
 *
 *  * Route, destination folder and resources are set once in the ctor.
 *  * Handles are opaque strings issued by the repository / endpoint.
 */
  class Task {
  public:
    Task(TaskRoute route, std::string destinationFolder, std::vector<DataResource> resources);

    const TaskRoute& route() const { return route_; }
    const std::string& destinationFolder() const { return destinationFolder_; }
    const std::vector<DataResource>& resources() const { return resources_; }

    std::vector<std::string> fileIds() const;
    bool hasArchives() const;
    bool isTerminal() const { return model::isTerminal(status.code); }

    /// Finalizing but archive members still have to be unpacked.
    bool needsExtraction() const {
      return status.code == StatusCode::Finalizing && hasArchives() && !extracted;
    }

    void fail(const std::string& message);
    void succeed();

    //---progress---------------------------------------------------------------
    std::optional<std::string> stagingHandle{};
    StagingStatus stagingStatus{ StagingStatus::Unknown };
    std::optional<std::string> transferHandle{};
    TransferStatus status{};
    bool extracted{ false };
    std::vector<std::string> extractedFiles{};
    std::optional<std::string> error{};

  private:
    TaskRoute route_;
    std::string destinationFolder_;
    std::vector<DataResource> resources_;
  };

} // namespace ferry::model
