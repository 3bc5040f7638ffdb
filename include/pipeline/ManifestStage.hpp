#pragma once
/** @file  ManifestStage.hpp
 *  @brief Transfer-level final stage: write (and optionally deliver) the manifest.
 *
 *  © 2025 ferry contributors — MIT-licensed.
 */

#include <string>

#include <boost/uuid/random_generator.hpp>
#include <nlohmann/json.hpp>

#include "model/Transfer.hpp"
#include "pipeline/Stage.hpp"

namespace ferry::pipeline {

  /**
 * @class ManifestStage
 * @brief Runs once every task of a transfer is Finalizing with extraction done.
 *
 *  * First run writes `<manifest_dir>/manifest-<transfer id>.json` (a
 *    Frictionless data package) and assigns the manifest UUID.
 *  * With `deliver_manifest`, the file is copied from the service's local
 *    endpoint to the destination; later runs poll that copy.
 *  * When done every task becomes Succeeded. Failures throw `ManifestError`.
 */
  class ManifestStage {
  public:
    bool appliesTo(const model::Transfer& transfer) const;
    void run(model::Transfer& transfer, StageContext& ctx);

    /// Cancels an in-flight manifest delivery; errors are logged and escalated.
    void cancel(model::Transfer& transfer, StageContext& ctx);

    static std::string fileFor(const std::string& manifestDir, const model::TransferId& id);
    static nlohmann::json build(const model::Transfer& transfer);

  private:
    void write(model::Transfer& transfer, StageContext& ctx);
    void deliver(model::Transfer& transfer, StageContext& ctx);
    void poll(model::Transfer& transfer, StageContext& ctx);
    std::shared_ptr<backend::TransportEndpoint> localEndpoint(StageContext& ctx) const;

    boost::uuids::random_generator uuids_;
  };

} // namespace ferry::pipeline
