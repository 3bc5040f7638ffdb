#pragma once
/** @file  Stage.hpp
 *  @brief Abstract base class for the per-task pipeline stages.
 *
 *  © 2025 ferry contributors — MIT-licensed.
 */

#include <memory>
#include <string>
#include <vector>

#include "core/Registry.hpp"

namespace ferry::core { // forward decls only
  struct EngineConfig;
  class ErrorMonitor;
  class Logger;
} // namespace ferry::core

namespace ferry::backend {
  class ArchiveExtractor;
}

namespace ferry::model {
  class Task;
  struct Transfer;
} // namespace ferry::model

namespace ferry::pipeline {

  /// Everything a stage may touch besides the task itself.
  struct StageContext {
    const core::EngineConfig& config;
    core::RepositoryRegistry& repositories;
    core::EndpointRegistry& endpoints;
    backend::ArchiveExtractor* extractor; ///< may be null
    core::ErrorMonitor& errors;
    core::Logger& logger;
  };

  /**
 * @class Stage
 * @brief One step of a task's state machine (Prepare, Transfer, Extract).
 *
 *  * `appliesTo()` looks only at the task's current state.
 *  * `run()` advances the task at most one step and throws on failure; the
 *    engine turns the exception into a failed task.
 *  * Runs synchronously on the engine's worker thread.
 */
  class Stage {
  public:
    virtual ~Stage() = default;

    virtual const char* name() const = 0;
    virtual bool appliesTo(const model::Task& task) const = 0;
    virtual void run(model::Task& task, const model::Transfer& transfer, StageContext& ctx) = 0;
  };

  /// Prepare -> Transfer -> Extract, in pipeline order.
  std::vector<std::unique_ptr<Stage>> makeTaskStages();

  //---helpers shared by the stages-----------------------------------------------
  std::string joinPath(const std::string& dir, const std::string& name);
  std::string parentPath(const std::string& path);

  /// Source endpoint of \p task; throws `ResourceEndpointError` if empty or unregistered.
  std::shared_ptr<backend::TransportEndpoint> sourceEndpoint(const model::Task& task,
                                                             StageContext& ctx);
  std::shared_ptr<backend::TransportEndpoint> destinationEndpoint(const model::Task& task,
                                                                  StageContext& ctx);

  /**
   * Cancels any open transfer of \p task and fails it with \p reason.
   * Endpoint errors are logged and escalated, never thrown.
   */
  void cancelTask(model::Task& task, const std::string& reason, StageContext& ctx);

} // namespace ferry::pipeline
