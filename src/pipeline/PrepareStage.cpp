/* @file PrepareStage.cpp
 * @brief staging request / staging poll
 *
 * © 2025 ferry contributors — MIT-licensed.
 */

// ferry headers
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "model/Transfer.hpp"
#include "pipeline/PrepareStage.hpp"

using namespace ferry;
using namespace ferry::pipeline;
using model::StagingStatus;
using model::StatusCode;

bool PrepareStage::appliesTo(const model::Task& task) const {
  return task.status.code == StatusCode::Staging || task.status.code == StatusCode::Unknown;
}

void PrepareStage::run(model::Task& task, const model::Transfer& transfer, StageContext& ctx) {
  auto endpoint = sourceEndpoint(task, ctx);
  auto repository = ctx.repositories.resolve(task.route().source);

  if (!task.stagingHandle) {
    if (endpoint->filesStaged(task.resources())) {
      task.stagingStatus = StagingStatus::Succeeded;
      task.status.code = StatusCode::Active;
      return;
    }
    task.stagingHandle = repository->stageFiles(task.fileIds());
    task.stagingStatus = StagingStatus::Active;
    task.status.code = StatusCode::Staging;
    ctx.logger.log(core::LogLevel::Debug, "PrepareStage",
                   "transfer " + model::toString(transfer.id) + ": staging " +
                       std::to_string(task.resources().size()) + " file(s) at '" +
                       task.route().sourceEndpoint + "' (" + *task.stagingHandle + ")");
    return;
  }

  task.stagingStatus = repository->stagingStatus(*task.stagingHandle);
  switch (task.stagingStatus) {
  case StagingStatus::Succeeded:
    task.status.code = StatusCode::Active;
    break;
  case StagingStatus::Failed:
    throw core::TaskError("staging failed");
  default:
    break; // still staging
  }
}
