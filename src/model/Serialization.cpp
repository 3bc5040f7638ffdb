/* @file Serialization.cpp
 * @brief JSON encoding of transfers and tasks for the snapshot file
 *
 * © 2025 ferry contributors — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <stdexcept>

// Boost headers
#include <boost/uuid/string_generator.hpp>

// ferry headers
#include "model/Serialization.hpp"

using nlohmann::json;
using namespace ferry::model;

namespace {

  std::int64_t toMillis(Clock::time_point t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
  }

  Clock::time_point fromMillis(std::int64_t ms) {
    return Clock::time_point{ std::chrono::duration_cast<Clock::duration>(
        std::chrono::milliseconds{ ms }) };
  }

  json optionalString(const std::optional<std::string>& v) {
    return v ? json(*v) : json(nullptr);
  }

  std::optional<std::string> readOptionalString(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null())
      return std::nullopt;
    return j.at(key).get<std::string>();
  }

} // namespace

TransferId ferry::model::parseTransferId(const std::string& text) {
  // string_generator throws std::runtime_error on malformed input
  return boost::uuids::string_generator{}(text);
}

//---value types----------------------------------------------------------------
void ferry::model::to_json(json& j, const TransferStatus& s) {
  j = json{ { "code", s.code },
            { "message", s.message },
            { "num_files", s.numFiles },
            { "num_files_transferred", s.numFilesTransferred } };
}

void ferry::model::from_json(const json& j, TransferStatus& s) {
  j.at("code").get_to(s.code);
  j.at("message").get_to(s.message);
  j.at("num_files").get_to(s.numFiles);
  j.at("num_files_transferred").get_to(s.numFilesTransferred);
}

void ferry::model::to_json(json& j, const DataResource& r) {
  j = json{ { "id", r.id },           { "name", r.name },   { "path", r.path },
            { "format", r.format },   { "media_type", r.mediaType },
            { "bytes", r.bytes },     { "hash", r.hash },   { "endpoint", r.endpoint },
            { "archive", r.archive } };
}

void ferry::model::from_json(const json& j, DataResource& r) {
  j.at("id").get_to(r.id);
  j.at("name").get_to(r.name);
  j.at("path").get_to(r.path);
  r.format = j.value("format", "");
  r.mediaType = j.value("media_type", "");
  r.bytes = j.value("bytes", std::uint64_t{ 0 });
  r.hash = j.value("hash", "");
  r.endpoint = j.value("endpoint", "");
  r.archive = j.value("archive", false);
}

void ferry::model::to_json(json& j, const UserInfo& u) {
  j = json{ { "name", u.name },
            { "email", u.email },
            { "organization", u.organization },
            { "orcid", u.orcid } };
}

void ferry::model::from_json(const json& j, UserInfo& u) {
  u.name = j.value("name", "");
  u.email = j.value("email", "");
  u.organization = j.value("organization", "");
  u.orcid = j.value("orcid", "");
}

void ferry::model::to_json(json& j, const TaskRoute& r) {
  j = json{ { "source", r.source },
            { "destination", r.destination },
            { "source_endpoint", r.sourceEndpoint },
            { "destination_endpoint", r.destinationEndpoint } };
}

void ferry::model::from_json(const json& j, TaskRoute& r) {
  j.at("source").get_to(r.source);
  j.at("destination").get_to(r.destination);
  j.at("source_endpoint").get_to(r.sourceEndpoint);
  j.at("destination_endpoint").get_to(r.destinationEndpoint);
}

//---tasks----------------------------------------------------------------------
json ferry::model::toJson(const Task& task) {
  return json{ { "route", task.route() },
               { "destination_folder", task.destinationFolder() },
               { "resources", task.resources() },
               { "staging_handle", optionalString(task.stagingHandle) },
               { "staging_status", task.stagingStatus },
               { "transfer_handle", optionalString(task.transferHandle) },
               { "status", task.status },
               { "extracted", task.extracted },
               { "extracted_files", task.extractedFiles },
               { "error", optionalString(task.error) } };
}

Task ferry::model::taskFromJson(const json& j) {
  Task task(j.at("route").get<TaskRoute>(), j.at("destination_folder").get<std::string>(),
            j.at("resources").get<std::vector<DataResource>>());
  task.stagingHandle = readOptionalString(j, "staging_handle");
  j.at("staging_status").get_to(task.stagingStatus);
  task.transferHandle = readOptionalString(j, "transfer_handle");
  j.at("status").get_to(task.status);
  task.extracted = j.value("extracted", false);
  if (j.contains("extracted_files"))
    j.at("extracted_files").get_to(task.extractedFiles);
  task.error = readOptionalString(j, "error");
  return task;
}

//---transfers------------------------------------------------------------------
json ferry::model::toJson(const Transfer& t) {
  auto tasks = json::array();
  for (const auto& task : t.tasks)
    tasks.push_back(toJson(task));

  return json{
    { "id", toString(t.id) },
    { "source", t.spec.source },
    { "destination", t.spec.destination },
    { "file_ids", t.spec.fileIds },
    { "description", t.spec.description },
    { "user", t.spec.user },
    { "instructions", t.instructions.toJson() },
    { "tasks", std::move(tasks) },
    { "status", t.status },
    { "canceled", t.canceled },
    { "created", toMillis(t.created) },
    { "completed", toMillis(t.completed) },
    { "destination_folder", t.destinationFolder },
    { "manifest_id", t.manifestId ? json(toString(*t.manifestId)) : json(nullptr) },
    { "manifest_file", t.manifestFile },
    { "manifest_handle", optionalString(t.manifestHandle) },
    { "payload_bytes", t.payloadBytes },
  };
}

Transfer ferry::model::transferFromJson(const json& j) {
  Transfer t;
  t.id = parseTransferId(j.at("id").get<std::string>());
  j.at("source").get_to(t.spec.source);
  j.at("destination").get_to(t.spec.destination);
  j.at("file_ids").get_to(t.spec.fileIds);
  t.spec.description = j.value("description", "");
  if (j.contains("user"))
    j.at("user").get_to(t.spec.user);
  t.spec.instructions = j.value("instructions", json::object());
  t.instructions = Instructions::parse(t.spec.instructions);

  for (const auto& task : j.at("tasks"))
    t.tasks.push_back(taskFromJson(task));

  j.at("status").get_to(t.status);
  t.canceled = j.value("canceled", false);
  t.created = fromMillis(j.at("created").get<std::int64_t>());
  t.completed = fromMillis(j.at("completed").get<std::int64_t>());
  t.destinationFolder = j.value("destination_folder", "");
  if (auto id = readOptionalString(j, "manifest_id"))
    t.manifestId = parseTransferId(*id);
  t.manifestFile = j.value("manifest_file", "");
  t.manifestHandle = readOptionalString(j, "manifest_handle");
  t.payloadBytes = j.value("payload_bytes", std::uint64_t{ 0 });
  return t;
}
