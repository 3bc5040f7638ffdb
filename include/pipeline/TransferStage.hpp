#pragma once
/** @file  TransferStage.hpp
 *  @brief Starts and tracks the endpoint-to-endpoint copy of a task's files.
 *
 *  © 2025 ferry contributors — MIT-licensed.
 */

#include <vector>

#include "model/Resource.hpp"
#include "pipeline/Stage.hpp"

namespace ferry::pipeline {

  class TransferStage : public Stage {
  public:
    const char* name() const override { return "transfer"; }
    bool appliesTo(const model::Task& task) const override;
    void run(model::Task& task, const model::Transfer& transfer, StageContext& ctx) override;

    /// Source path = resource path, destination = destination folder / resource path.
    static std::vector<model::FileTransfer> fileList(const model::Task& task);
  };

} // namespace ferry::pipeline
