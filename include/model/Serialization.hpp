#pragma once
/** @file  Serialization.hpp
 *  @brief nlohmann::json conversions for the data model (snapshot schema v1).
 *
 *  © 2025 ferry contributors — MIT-licensed.
 */

#include <nlohmann/json.hpp>

#include "model/Resource.hpp"
#include "model/Specification.hpp"
#include "model/Task.hpp"
#include "model/Transfer.hpp"
#include "model/TransferStatus.hpp"

namespace ferry::model {

  NLOHMANN_JSON_SERIALIZE_ENUM(StatusCode, {
                                               { StatusCode::Unknown, "unknown" },
                                               { StatusCode::Staging, "staging" },
                                               { StatusCode::Active, "active" },
                                               { StatusCode::Inactive, "inactive" },
                                               { StatusCode::Finalizing, "finalizing" },
                                               { StatusCode::Succeeded, "succeeded" },
                                               { StatusCode::Failed, "failed" },
                                           })

  NLOHMANN_JSON_SERIALIZE_ENUM(StagingStatus, {
                                                  { StagingStatus::Unknown, "unknown" },
                                                  { StagingStatus::Active, "active" },
                                                  { StagingStatus::Succeeded, "succeeded" },
                                                  { StagingStatus::Failed, "failed" },
                                              })

  void to_json(nlohmann::json& j, const TransferStatus& s);
  void from_json(const nlohmann::json& j, TransferStatus& s);

  void to_json(nlohmann::json& j, const DataResource& r);
  void from_json(const nlohmann::json& j, DataResource& r);

  void to_json(nlohmann::json& j, const UserInfo& u);
  void from_json(const nlohmann::json& j, UserInfo& u);

  void to_json(nlohmann::json& j, const TaskRoute& r);
  void from_json(const nlohmann::json& j, TaskRoute& r);

  // Task and Transfer have no default state worth exposing, so they get
  // explicit factory functions instead of from_json overloads.
  nlohmann::json toJson(const Task& task);
  Task taskFromJson(const nlohmann::json& j);

  /// Throws nlohmann::json::exception or std::runtime_error on malformed input.
  nlohmann::json toJson(const Transfer& transfer);
  Transfer transferFromJson(const nlohmann::json& j);

  TransferId parseTransferId(const std::string& text);

} // namespace ferry::model
