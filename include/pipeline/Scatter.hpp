#pragma once
/** @file  Scatter.hpp
 *  @brief Validates a specification and splits it into per-endpoint tasks.
 *
 *  © 2025 ferry contributors — MIT-licensed.
 */

#include <string>
#include <vector>

#include "core/EngineConfig.hpp"
#include "core/Registry.hpp"
#include "model/Specification.hpp"
#include "model/Transfer.hpp"

namespace ferry::pipeline {

  /**
   * Builds a new Transfer (status Staging) for \p spec or throws without
   * creating any state:
   *   NoFilesRequestedError, InvalidTextError, InvalidInstructionsError,
   *   NameResolutionError, PayloadTooLargeError, or whatever the source repository throws.
   */
  model::Transfer scatter(const model::TransferId& id, const model::Specification& spec,
                          const core::EngineConfig& config, core::RepositoryRegistry& repositories);

  /// File IDs with duplicates removed, first occurrence kept.
  std::vector<std::string> uniqueFileIds(const std::vector<std::string>& ids);

  /// Resources grouped by endpoint, groups in order of first appearance.
  std::vector<std::vector<model::DataResource>>
  partitionByEndpoint(const std::vector<model::DataResource>& resources);

} // namespace ferry::pipeline
