/* @file Scatter.cpp
 * @brief specification validation, endpoint assignment and task partitioning
 *
 * © 2025 ferry contributors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <unordered_set>

// nlohmann headers
#include <nlohmann/json.hpp>

// ferry headers
#include "core/Errors.hpp"
#include "pipeline/Scatter.hpp"
#include "pipeline/Stage.hpp"

using namespace ferry;
using namespace ferry::pipeline;

namespace {

  constexpr double kBytesPerGb = 1.0e9;

  /// The repository's only endpoint, or "" if it has none or several.
  std::string singleEndpoint(const core::RepositoryConfig& cfg) {
    if (cfg.endpointCount() != 1)
      return {};
    if (!cfg.endpoint.empty())
      return cfg.endpoint;
    return cfg.endpoints.begin()->second;
  }

  /// Throws InvalidTextError if \p value holds a string that is not valid UTF-8.
  void requireUtf8(const std::string& field, const nlohmann::json& value) {
    try {
      (void)value.dump();
    } catch (const nlohmann::json::type_error&) {
      throw core::InvalidTextError(field);
    }
  }

  void requireUtf8(const model::Specification& spec) {
    requireUtf8("source", spec.source);
    requireUtf8("destination", spec.destination);
    requireUtf8("description", spec.description);
    requireUtf8("file_ids", spec.fileIds);
    requireUtf8("instructions", spec.instructions);
    requireUtf8("user.name", spec.user.name);
    requireUtf8("user.email", spec.user.email);
    requireUtf8("user.organization", spec.user.organization);
    requireUtf8("user.orcid", spec.user.orcid);
  }

} // namespace

std::vector<std::string> ferry::pipeline::uniqueFileIds(const std::vector<std::string>& ids) {
  std::vector<std::string> out;
  std::unordered_set<std::string> seen;
  for (const auto& id : ids)
    if (seen.insert(id).second)
      out.push_back(id);
  return out;
}

std::vector<std::vector<model::DataResource>>
ferry::pipeline::partitionByEndpoint(const std::vector<model::DataResource>& resources) {
  std::vector<std::string> order;
  std::vector<std::vector<model::DataResource>> groups;
  for (const auto& r : resources) {
    auto it = std::find(order.begin(), order.end(), r.endpoint);
    if (it == order.end()) {
      order.push_back(r.endpoint);
      groups.push_back({ r });
    } else {
      groups[static_cast<std::size_t>(it - order.begin())].push_back(r);
    }
  }
  return groups;
}

model::Transfer ferry::pipeline::scatter(const model::TransferId& id,
                                         const model::Specification& spec,
                                         const core::EngineConfig& config,
                                         core::RepositoryRegistry& repositories) {
  if (spec.fileIds.empty())
    throw core::NoFilesRequestedError();
  requireUtf8(spec);

  auto instructions = model::Instructions::parse(spec.instructions);
  auto source = repositories.resolve(spec.source);
  auto destination = repositories.resolve(spec.destination);

  auto resources = source->resolveResources(uniqueFileIds(spec.fileIds));
  if (resources.empty())
    throw core::Error("repository '" + spec.source + "' resolved none of the requested files");

  std::uint64_t payload = 0;
  for (const auto& r : resources)
    payload += r.bytes;
  const double payloadGb = static_cast<double>(payload) / kBytesPerGb;
  if (payloadGb > config.service.maxPayloadSize)
    throw core::PayloadTooLargeError(payloadGb, config.service.maxPayloadSize);

  // with a single configured endpoint it wins over whatever the descriptors say
  const auto sourceCfg = config.repository(spec.source);
  if (const auto only = singleEndpoint(sourceCfg); !only.empty())
    for (auto& r : resources)
      r.endpoint = only;
  const auto destinationEndpoint = config.repository(spec.destination).destinationEndpoint();

  model::Transfer transfer;
  transfer.id = id;
  transfer.spec = spec;
  transfer.instructions = std::move(instructions);
  transfer.payloadBytes = payload;
  transfer.created = model::Clock::now();
  transfer.destinationFolder =
      joinPath(destination->resolveLocalUser(spec.user.orcid), "ferry-" + model::toString(id));

  for (auto& group : partitionByEndpoint(resources)) {
    model::TaskRoute route{ spec.source, spec.destination, group.front().endpoint,
                            destinationEndpoint };
    transfer.tasks.emplace_back(std::move(route), transfer.destinationFolder, std::move(group));
  }
  transfer.refreshStatus();
  return transfer;
}
