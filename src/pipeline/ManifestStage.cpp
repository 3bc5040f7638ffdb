/* @file ManifestStage.cpp
 * @brief manifest generation, delivery and transfer completion
 *
 * © 2025 ferry contributors — MIT-licensed.
 */

// STL headers
#include <exception>
#include <fstream>

// ferry headers
#include "core/EngineConfig.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "model/Serialization.hpp"
#include "pipeline/ManifestStage.hpp"

using nlohmann::json;
using namespace ferry;
using namespace ferry::pipeline;
using model::StatusCode;

namespace {

  void finish(model::Transfer& transfer) {
    for (auto& task : transfer.tasks)
      if (!task.isTerminal())
        task.succeed();
  }

  json resourceEntry(const model::DataResource& r, const std::string& folder) {
    json entry{ { "id", r.id },
                { "name", r.name },
                { "path", joinPath(folder, r.path) },
                { "format", r.format },
                { "media_type", r.mediaType },
                { "bytes", r.bytes },
                { "hash", r.hash },
                { "hash_algorithm", r.hashAlgorithm() } };
    if (!r.endpoint.empty())
      entry["endpoint"] = r.endpoint;
    if (r.archive)
      entry["archive"] = true;
    return entry;
  }

} // namespace

bool ManifestStage::appliesTo(const model::Transfer& transfer) const {
  if (transfer.isTerminal() || transfer.canceled)
    return false;
  return transfer.manifestHandle.has_value() || transfer.readyForManifest();
}

std::string ManifestStage::fileFor(const std::string& manifestDir, const model::TransferId& id) {
  return joinPath(manifestDir, "manifest-" + model::toString(id) + ".json");
}

json ManifestStage::build(const model::Transfer& transfer) {
  auto resources = json::array();
  auto extracted = json::array();
  for (const auto& task : transfer.tasks) {
    for (const auto& r : task.resources())
      resources.push_back(resourceEntry(r, task.destinationFolder()));
    for (const auto& file : task.extractedFiles)
      extracted.push_back(joinPath(task.destinationFolder(), file));
  }

  const auto& user = transfer.spec.user;
  json manifest{
    { "name", "manifest" },
    { "id", transfer.manifestId ? model::toString(*transfer.manifestId) : std::string{} },
    { "profile", "data-package" },
    { "created", model::toRfc3339(model::Clock::now()) },
    { "keywords", json::array({ "ferry", "manifest" }) },
    { "contributors", json::array({ json{ { "title", user.name },
                                          { "email", user.email },
                                          { "organization", user.organization },
                                          { "path", user.orcid },
                                          { "role", "author" } } }) },
    { "description", transfer.spec.description },
    { "instructions", transfer.instructions.toJson() },
    { "resources", std::move(resources) },
  };
  if (!extracted.empty())
    manifest["extracted"] = std::move(extracted);
  return manifest;
}

void ManifestStage::run(model::Transfer& transfer, StageContext& ctx) {
  try {
    if (!transfer.manifestId) {
      write(transfer, ctx);
      if (transfer.instructions.deliverManifest())
        deliver(transfer, ctx);
      else
        finish(transfer);
    } else if (transfer.manifestHandle) {
      poll(transfer, ctx);
    } else {
      finish(transfer);
    }
  } catch (const core::ManifestError&) {
    throw;
  } catch (const std::exception& e) {
    throw core::ManifestError(std::string("manifest: ") + e.what());
  }
}

void ManifestStage::cancel(model::Transfer& transfer, StageContext& ctx) {
  if (!transfer.manifestHandle)
    return;
  try {
    localEndpoint(ctx)->cancel(*transfer.manifestHandle);
  } catch (const std::exception& e) {
    const std::string msg = "[ManifestStage] cancelling manifest delivery for transfer " +
                            model::toString(transfer.id) + " failed: " + e.what();
    ctx.logger.log(core::LogLevel::Error, "ManifestStage", msg);
    ctx.errors.notifyFailure(msg);
  }
  transfer.manifestHandle.reset();
}

//---private----------------------------------------------------------------------
void ManifestStage::write(model::Transfer& transfer, StageContext& ctx) {
  transfer.manifestId = uuids_();
  transfer.manifestFile = fileFor(ctx.config.service.manifestDirectory, transfer.id);

  std::ofstream out(transfer.manifestFile, std::ios::trunc);
  if (!out)
    throw core::ManifestError("cannot create manifest file " + transfer.manifestFile);
  out << build(transfer).dump(2, ' ', false, json::error_handler_t::replace);
  out.flush();
  if (!out)
    throw core::ManifestError("writing manifest file " + transfer.manifestFile + " failed");

  ctx.logger.log(core::LogLevel::Info, "ManifestStage",
                 "transfer " + model::toString(transfer.id) + ": wrote " + transfer.manifestFile);
}

void ManifestStage::deliver(model::Transfer& transfer, StageContext& ctx) {
  if (transfer.tasks.empty())
    throw core::ManifestError("transfer has no tasks to deliver a manifest for");

  auto local = localEndpoint(ctx);
  const auto& route = transfer.tasks.front().route();
  if (route.destinationEndpoint.empty() || !ctx.endpoints.contains(route.destinationEndpoint))
    throw core::ManifestError("cannot deliver manifest: invalid destination endpoint '" +
                              route.destinationEndpoint + "'");
  auto destination = ctx.endpoints.resolve(route.destinationEndpoint);

  const auto* instruction = transfer.instructions.deliverManifest();
  std::vector<model::FileTransfer> files{
    { transfer.manifestFile, joinPath(transfer.destinationFolder, instruction->filename), "" }
  };
  transfer.manifestHandle = local->beginTransfer(*destination, files);
}

void ManifestStage::poll(model::Transfer& transfer, StageContext& ctx) {
  const auto remote = localEndpoint(ctx)->status(*transfer.manifestHandle);
  if (remote.code == StatusCode::Succeeded) {
    transfer.manifestHandle.reset();
    finish(transfer);
  } else if (remote.code == StatusCode::Failed) {
    transfer.manifestHandle.reset();
    throw core::ManifestError("manifest delivery failed: " + remote.message);
  }
}

std::shared_ptr<backend::TransportEndpoint> ManifestStage::localEndpoint(StageContext& ctx) const {
  const auto& name = ctx.config.service.endpoint;
  if (name.empty() || !ctx.endpoints.contains(name))
    throw core::ManifestError("no usable local endpoint ('" + name + "') for manifest delivery");
  return ctx.endpoints.resolve(name);
}
