/* @file TransferStage.cpp
 * @brief begins the copy, then mirrors the endpoint's transfer status
 *
 * © 2025 ferry contributors — MIT-licensed.
 */

// ferry headers
#include "core/EngineConfig.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "model/Transfer.hpp"
#include "pipeline/TransferStage.hpp"

using namespace ferry;
using namespace ferry::pipeline;
using model::StatusCode;

bool TransferStage::appliesTo(const model::Task& task) const {
  return task.status.code == StatusCode::Active || task.status.code == StatusCode::Inactive;
}

std::vector<model::FileTransfer> TransferStage::fileList(const model::Task& task) {
  std::vector<model::FileTransfer> files;
  files.reserve(task.resources().size());
  for (const auto& r : task.resources())
    files.push_back({ r.path, joinPath(task.destinationFolder(), r.path), r.hash });
  return files;
}

void TransferStage::run(model::Task& task, const model::Transfer& transfer, StageContext& ctx) {
  auto source = sourceEndpoint(task, ctx);

  if (!task.transferHandle) {
    auto destination = destinationEndpoint(task, ctx);
    if (ctx.config.service.doubleCheckStaging && !source->filesStaged(task.resources()))
      throw core::TaskError("files are not staged at endpoint '" + task.route().sourceEndpoint + "'");

    task.transferHandle = source->beginTransfer(*destination, fileList(task));
    task.status.code = StatusCode::Active;
    ctx.logger.log(core::LogLevel::Debug, "TransferStage",
                   "transfer " + model::toString(transfer.id) + ": copying '" +
                       task.route().sourceEndpoint + "' -> '" + task.route().destinationEndpoint +
                       "' (" + *task.transferHandle + ")");
    return;
  }

  const auto remote = source->status(*task.transferHandle);
  task.status.numFilesTransferred = remote.numFilesTransferred;
  task.status.message = remote.message;

  switch (remote.code) {
  case StatusCode::Active:
  case StatusCode::Inactive:
    task.status.code = remote.code;
    break;
  case StatusCode::Succeeded:
    task.status.code = StatusCode::Finalizing;
    task.status.numFilesTransferred = task.status.numFiles;
    task.status.message.clear();
    break;
  case StatusCode::Failed:
    throw core::TaskError(remote.message.empty() ? "transfer failed" : remote.message);
  default:
    break;
  }
}
