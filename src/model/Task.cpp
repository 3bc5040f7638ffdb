/* @file Task.cpp
 * @brief task construction and terminal transitions
 *
 * © 2025 ferry contributors — MIT-licensed.
 */

// STL headers
#include <algorithm>

// ferry headers
#include "model/Task.hpp"

using namespace ferry::model;

Task::Task(TaskRoute route, std::string destinationFolder, std::vector<DataResource> resources)
    : route_(std::move(route)), destinationFolder_(std::move(destinationFolder)),
      resources_(std::move(resources)) {
  status.numFiles = resources_.size();
  status.code = StatusCode::Staging; // every task starts out staging
}

std::vector<std::string> Task::fileIds() const {
  std::vector<std::string> ids;
  ids.reserve(resources_.size());
  for (const auto& r : resources_)
    ids.push_back(r.id);
  return ids;
}

bool Task::hasArchives() const {
  return std::any_of(resources_.begin(), resources_.end(),
                     [](const DataResource& r) { return r.archive; });
}

void Task::fail(const std::string& message) {
  error = message;
  status.code = StatusCode::Failed;
  status.message = message;
}

void Task::succeed() {
  status.code = StatusCode::Succeeded;
  status.message.clear();
  status.numFilesTransferred = status.numFiles;
}
