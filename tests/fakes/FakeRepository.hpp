#pragma once
/** @file  FakeRepository.hpp
 *  @brief In-memory Repository with scripted staging outcomes for engine testing.
 *
 *  © 2025 ferry contributors — MIT-licensed.
 */

#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "backend/Repository.hpp"

namespace ferry {
  namespace test {

    /**
 * @class FakeRepository
 * @brief Serves descriptors from `catalog`; staging requests complete with
 *        `stagingOutcome` the first time they are polled.
 */
    class FakeRepository : public ferry::backend::Repository {
    public:
      explicit FakeRepository(std::vector<model::DataResource> files = {})
          : catalog(std::move(files)) {}

      std::vector<model::DataResource> catalog;
      model::StagingStatus stagingOutcome = model::StagingStatus::Succeeded;
      std::string localUser = "localuser";
      int stageCalls = 0;
      int loadStateCalls = 0;
      std::map<std::string, std::vector<std::string>> stagingRequests; ///< handle -> file IDs

      backend::SearchResults search(const backend::SearchParameters& params) override {
        backend::SearchResults results;
        for (const auto& r : catalog)
          if (r.name.find(params.query) != std::string::npos)
            results.resources.push_back(r);
        return results;
      }

      std::vector<model::DataResource> resolveResources(const std::vector<std::string>& ids) override {
        std::vector<model::DataResource> out;
        for (const auto& id : ids) {
          bool found = false;
          for (const auto& r : catalog) {
            if (r.id == id) {
              out.push_back(r);
              found = true;
            }
          }
          if (!found)
            throw std::runtime_error("[FakeRepository] unknown file ID: " + id);
        }
        return out;
      }

      std::string stageFiles(const std::vector<std::string>& ids) override {
        const auto handle = "stage-" + std::to_string(++stageCalls);
        stagingRequests[handle] = ids;
        return handle;
      }

      model::StagingStatus stagingStatus(const std::string& handle) override {
        if (!stagingRequests.count(handle))
          throw std::runtime_error("[FakeRepository] unknown staging handle: " + handle);
        return stagingOutcome;
      }

      std::string resolveLocalUser(const std::string&) override { return localUser; }

      std::vector<std::uint8_t> saveState() override {
        const auto doc = nlohmann::json{ { "staging", stagingRequests } }.dump();
        return { doc.begin(), doc.end() };
      }

      void loadState(const std::vector<std::uint8_t>& state) override {
        ++loadStateCalls;
        const auto doc = nlohmann::json::parse(state.begin(), state.end());
        doc.at("staging").get_to(stagingRequests);
      }
    };

  } // namespace test
} // namespace ferry
