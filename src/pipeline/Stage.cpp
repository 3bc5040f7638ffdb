/* @file Stage.cpp
 * @brief stage list, endpoint lookup and task cancellation
 *
 * © 2025 ferry contributors — MIT-licensed.
 */

// STL headers
#include <exception>

// ferry headers
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "model/Task.hpp"
#include "pipeline/ExtractStage.hpp"
#include "pipeline/PrepareStage.hpp"
#include "pipeline/Stage.hpp"
#include "pipeline/TransferStage.hpp"

using namespace ferry;
using namespace ferry::pipeline;

namespace {

  std::string firstResourceId(const model::Task& task) {
    return task.resources().empty() ? std::string{} : task.resources().front().id;
  }

  std::shared_ptr<backend::TransportEndpoint> lookup(const std::string& repository,
                                                     const std::string& endpoint,
                                                     const model::Task& task, StageContext& ctx) {
    if (endpoint.empty() || !ctx.endpoints.contains(endpoint))
      throw core::ResourceEndpointError(repository, firstResourceId(task), endpoint);
    return ctx.endpoints.resolve(endpoint);
  }

} // namespace

std::vector<std::unique_ptr<Stage>> ferry::pipeline::makeTaskStages() {
  std::vector<std::unique_ptr<Stage>> stages;
  stages.push_back(std::make_unique<PrepareStage>());
  stages.push_back(std::make_unique<TransferStage>());
  stages.push_back(std::make_unique<ExtractStage>());
  return stages;
}

std::string ferry::pipeline::joinPath(const std::string& dir, const std::string& name) {
  if (dir.empty())
    return name;
  if (name.empty())
    return dir;
  const bool dirSlash = dir.back() == '/';
  const bool nameSlash = name.front() == '/';
  if (dirSlash && nameSlash)
    return dir + name.substr(1);
  if (dirSlash || nameSlash)
    return dir + name;
  return dir + '/' + name;
}

std::string ferry::pipeline::parentPath(const std::string& path) {
  auto slash = path.find_last_of('/');
  if (slash == std::string::npos)
    return {};
  if (slash == 0)
    return "/";
  return path.substr(0, slash);
}

std::shared_ptr<backend::TransportEndpoint> ferry::pipeline::sourceEndpoint(const model::Task& task,
                                                                           StageContext& ctx) {
  return lookup(task.route().source, task.route().sourceEndpoint, task, ctx);
}

std::shared_ptr<backend::TransportEndpoint>
ferry::pipeline::destinationEndpoint(const model::Task& task, StageContext& ctx) {
  return lookup(task.route().destination, task.route().destinationEndpoint, task, ctx);
}

void ferry::pipeline::cancelTask(model::Task& task, const std::string& reason, StageContext& ctx) {
  if (task.isTerminal())
    return;

  if (task.transferHandle) {
    try {
      sourceEndpoint(task, ctx)->cancel(*task.transferHandle);
    } catch (const std::exception& e) {
      const std::string msg = "[Pipeline] cancelling transfer " + *task.transferHandle +
                              " on endpoint '" + task.route().sourceEndpoint + "' failed: " + e.what();
      ctx.logger.log(core::LogLevel::Error, "Pipeline", msg);
      ctx.errors.notifyFailure(msg);
    }
  }
  task.fail(reason);
}
