#pragma once
/** @file  PrepareStage.hpp
 *  @brief Gets a task's files staged at its source endpoint.
 *
 *  © 2025 ferry contributors — MIT-licensed.
 */

#include "pipeline/Stage.hpp"

namespace ferry::pipeline {

  /**
 * @class PrepareStage
 * @brief Staging -> Active once the source repository reports the files ready.
 *
 *  * First run: skip staging if the endpoint already has the files, otherwise
 *    request it and keep the handle.
 *  * Later runs poll the handle; a failed staging throws `TaskError`.
 */
  class PrepareStage : public Stage {
  public:
    const char* name() const override { return "prepare"; }
    bool appliesTo(const model::Task& task) const override;
    void run(model::Task& task, const model::Transfer& transfer, StageContext& ctx) override;
  };

} // namespace ferry::pipeline
