#pragma once
/** @file  ExtractStage.hpp
 *  @brief Unpacks archive resources after they land at the destination.
 *
 *  © 2025 ferry contributors — MIT-licensed.
 */

#include "pipeline/Stage.hpp"

namespace ferry::pipeline {

  class ExtractStage : public Stage {
  public:
    const char* name() const override { return "extract"; }
    bool appliesTo(const model::Task& task) const override;
    void run(model::Task& task, const model::Transfer& transfer, StageContext& ctx) override;
  };

} // namespace ferry::pipeline
