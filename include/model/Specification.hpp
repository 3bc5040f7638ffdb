#pragma once
/** @file  Specification.hpp
 *  @brief Client-submitted transfer request.
 *
 *  © 2025 ferry contributors — MIT-licensed.
 */

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ferry::model {

  /// Requesting user, as known to the identity federation.
  struct UserInfo {
    std::string name;
    std::string email;
    std::string organization;
    std::string orcid;
  };

  struct Specification {
    std::string source;               ///< repository name
    std::string destination;          ///< repository name
    std::vector<std::string> fileIds; ///< must be non-empty
    std::string description;          ///< Markdown, free-form
    nlohmann::json instructions{};    ///< parsed into model::Instructions on create
    UserInfo user;
  };

} // namespace ferry::model
