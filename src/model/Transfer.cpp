/* @file Transfer.cpp
 * @brief status aggregation across the tasks of a transfer
 *
 * © 2025 ferry contributors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <ctime>

// Boost headers
#include <boost/uuid/uuid_io.hpp>

// ferry headers
#include "model/Transfer.hpp"

using namespace ferry::model;

std::string ferry::model::toString(const TransferId& id) { return boost::uuids::to_string(id); }

std::string ferry::model::toRfc3339(Clock::time_point t) {
  const auto secs = Clock::to_time_t(t);
  std::tm utc{};
  gmtime_r(&secs, &utc);
  char buf[32];
  std::strftime(buf, sizeof buf, "%Y-%m-%dT%H:%M:%SZ", &utc);
  return buf;
}

bool Transfer::readyForManifest() const {
  if (tasks.empty())
    return false;
  return std::all_of(tasks.begin(), tasks.end(), [](const Task& t) {
    return t.status.code == StatusCode::Finalizing && !t.needsExtraction();
  });
}

void Transfer::refreshStatus() { status = aggregateStatus(tasks); }

TransferStatus ferry::model::aggregateStatus(const std::vector<Task>& tasks) {
  TransferStatus out;
  if (tasks.empty())
    return out;

  const Task* failed = nullptr;
  bool allSucceeded = true;
  StatusCode slowest = StatusCode::Succeeded;

  for (const auto& task : tasks) {
    out.numFiles += task.status.numFiles;
    out.numFilesTransferred += task.status.numFilesTransferred;

    if (task.status.code == StatusCode::Failed) {
      if (!failed)
        failed = &task;
    }
    if (task.status.code != StatusCode::Succeeded)
      allSucceeded = false;
    if (!task.isTerminal() && progressRank(task.status.code) < progressRank(slowest))
      slowest = task.status.code;
  }

  if (failed) {
    out.code = StatusCode::Failed;
    out.message = failed->error.value_or(failed->status.message);
  } else if (allSucceeded) {
    out.code = StatusCode::Succeeded;
  } else {
    out.code = slowest;
  }
  return out;
}
