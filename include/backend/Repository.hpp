#pragma once
/** @file  Repository.hpp
 *  @brief Capability interface every scientific-data repository adapter implements.
 *
 *  © 2025 ferry contributors — MIT-licensed.
 */

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "model/Resource.hpp"
#include "model/TransferStatus.hpp"

namespace ferry::backend {

  struct SearchParameters {
    std::string query;
    std::optional<int> offset{};
    std::optional<int> limit{};
    std::map<std::string, std::string> specific{}; ///< repository-specific knobs
  };

  struct SearchResults {
    std::vector<model::DataResource> resources;
  };

  /**
 * @class Repository
 * @brief Search, resource resolution and staging for one repository.
 *
 *  * Errors are reported by throwing (preferably a core::Error subclass).
 *  * Calls are expected to be quick status checks; staging itself runs
 *    asynchronously on the repository side.
 *  * `saveState()` / `loadState()` let an adapter survive engine restarts.
 */
  class Repository {
  public:
    virtual ~Repository() = default;

    virtual SearchResults search(const SearchParameters& params) = 0;

    /// Descriptors for the given file IDs, in request order.
    virtual std::vector<model::DataResource> resolveResources(const std::vector<std::string>& fileIds) = 0;

    /// Begins staging and returns a handle for stagingStatus().
    virtual std::string stageFiles(const std::vector<std::string>& fileIds) = 0;

    virtual model::StagingStatus stagingStatus(const std::string& handle) = 0;

    /// Maps an external (ORCID) identity onto the repository's local user name.
    virtual std::string resolveLocalUser(const std::string& externalId) = 0;

    virtual std::vector<std::uint8_t> saveState() { return {}; }
    virtual void loadState(const std::vector<std::uint8_t>& state) { (void)state; }
  };

} // namespace ferry::backend
