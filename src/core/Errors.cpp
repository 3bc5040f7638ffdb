/* @file Errors.cpp
 * @brief message formatting for the ferry exception types
 *
 * © 2025 ferry contributors — MIT-licensed.
 */

#include <sstream>

#include "core/Errors.hpp"

using namespace ferry::core;

AlreadyRunningError::AlreadyRunningError()
    : Error("transfer engine is already running and cannot be started again") {}

NotRunningError::NotRunningError() : Error("transfer engine is not running") {}

DirectoryError::DirectoryError(const std::string& kind, const std::string& path,
                               const std::string& reason)
    : Error(kind + " directory '" + path + "': " + reason) {}

NoFilesRequestedError::NoFilesRequestedError() : Error("requested transfer includes no file IDs") {}

NotFoundError::NotFoundError(const std::string& transferId)
    : Error("transfer " + transferId + " was not found"), id_(transferId) {}

NameResolutionError::NameResolutionError(const std::string& kind, const std::string& name)
    : Error("unknown " + kind + " '" + name + "'"), name_(name) {}

InvalidInstructionsError::InvalidInstructionsError(const std::string& reason)
    : Error("invalid transfer instructions: " + reason) {}

InvalidTextError::InvalidTextError(const std::string& field)
    : Error("request field '" + field + "' is not valid UTF-8") {}

namespace {
  std::string payloadMessage(double sizeGb, double limitGb) {
    std::ostringstream os;
    os << "requested payload is too large: " << sizeGb << " GB (limit is " << limitGb << " GB)";
    return os.str();
  }
} // namespace

PayloadTooLargeError::PayloadTooLargeError(double sizeGb, double limitGb)
    : Error(payloadMessage(sizeGb, limitGb)) {}

ResourceEndpointError::ResourceEndpointError(const std::string& repository,
                                             const std::string& resourceId,
                                             const std::string& endpoint)
    : Error(endpoint.empty()
                ? "can't determine endpoint for resource '" + resourceId + "' in repository '" +
                      repository + "'"
                : "invalid endpoint '" + endpoint + "' for resource '" + resourceId +
                      "' in repository '" + repository + "'") {}
