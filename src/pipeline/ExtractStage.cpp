/* @file ExtractStage.cpp
 * @brief hands archive resources to the ArchiveExtractor
 *
 * © 2025 ferry contributors — MIT-licensed.
 */

// STL headers
#include <utility>

// ferry headers
#include "backend/ArchiveExtractor.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "model/Transfer.hpp"
#include "pipeline/ExtractStage.hpp"

using namespace ferry;
using namespace ferry::pipeline;

bool ExtractStage::appliesTo(const model::Task& task) const { return task.needsExtraction(); }

void ExtractStage::run(model::Task& task, const model::Transfer& transfer, StageContext& ctx) {
  if (!ctx.extractor)
    throw core::TaskError("archive extraction requested but no extractor is configured");

  const auto destination = destinationEndpoint(task, ctx);
  const std::string folder = joinPath(destination->root(), task.destinationFolder());

  std::vector<std::string> members;
  if (const auto* extract = transfer.instructions.extractArchives())
    members = extract->members;

  std::vector<std::string> extracted;
  for (const auto& r : task.resources()) {
    if (!r.archive)
      continue;
    const std::string archivePath = joinPath(folder, r.path);
    for (auto& file : ctx.extractor->extract(archivePath, members, parentPath(archivePath)))
      extracted.push_back(joinPath(parentPath(r.path), file)); // relative to destination folder
  }

  task.extractedFiles = std::move(extracted);
  task.extracted = true;
  ctx.logger.log(core::LogLevel::Info, "ExtractStage",
                 "transfer " + model::toString(transfer.id) + ": extracted " +
                     std::to_string(task.extractedFiles.size()) + " file(s)");
}
