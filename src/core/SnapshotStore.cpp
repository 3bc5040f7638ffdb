/* @file SnapshotStore.cpp
 * @brief JSON snapshot encode/decode and tmp+rename persistence
 *
 * © 2025 ferry contributors — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>

// nlohmann headers
#include <nlohmann/json.hpp>

// ferry headers
#include "core/Errors.hpp"
#include "core/SnapshotStore.hpp"
#include "model/Serialization.hpp"

using nlohmann::json;
using namespace ferry::core;

SnapshotStore::SnapshotStore(std::string path) : path_(std::move(path)) {}

std::string SnapshotStore::fileFor(const std::string& dataDir, const std::string& serviceName) {
  std::string dir = dataDir;
  if (!dir.empty() && dir.back() != '/')
    dir += '/';
  return serviceName.empty() ? dir + "ferry.json" : dir + "ferry-" + serviceName + ".json";
}

std::string SnapshotStore::encode(const Snapshot& snapshot) {
  auto transfers = json::array();
  for (const auto& t : snapshot.transfers)
    transfers.push_back(model::toJson(t));

  auto repos = json::array();
  for (const auto& [name, state] : snapshot.repositoryStates)
    repos.push_back(json{ { "name", name }, { "state", state } });

  json doc{ { "schema", kSchema },
            { "version", kVersion },
            { "transfers", std::move(transfers) },
            { "repositories", std::move(repos) } };
  return doc.dump(2, ' ', false, json::error_handler_t::replace);
}

Snapshot SnapshotStore::decode(const std::string& text) {
  json doc;
  try {
    doc = json::parse(text);
  } catch (const json::parse_error& e) {
    throw SnapshotCorruptError(std::string("[SnapshotStore] unparsable snapshot: ") + e.what());
  }

  if (!doc.is_object() || !doc.contains("schema") || !doc.at("schema").is_string() ||
      doc.at("schema").get<std::string>() != kSchema)
    throw SnapshotCorruptError("[SnapshotStore] not a ferry snapshot");
  if (!doc.contains("version") || !doc.at("version").is_number_integer() ||
      doc.at("version").get<int>() != kVersion)
    throw SnapshotCorruptError("[SnapshotStore] unsupported snapshot version (expected " +
                               std::to_string(kVersion) + ")");

  Snapshot snapshot;
  try {
    for (const auto& t : doc.at("transfers"))
      snapshot.transfers.push_back(model::transferFromJson(t));
    if (doc.contains("repositories")) {
      for (const auto& r : doc.at("repositories"))
        snapshot.repositoryStates.emplace_back(r.at("name").get<std::string>(),
                                               r.at("state").get<std::vector<std::uint8_t>>());
    }
  } catch (const std::exception& e) {
    // json::exception, bad UUIDs and invalid instructions all land here
    throw SnapshotCorruptError(std::string("[SnapshotStore] malformed snapshot entry: ") +
                               e.what());
  }
  return snapshot;
}

std::optional<Snapshot> SnapshotStore::load() const {
  std::ifstream in(path_);
  if (!in)
    return std::nullopt;

  std::stringstream raw;
  raw << in.rdbuf();
  return decode(raw.str());
}

void SnapshotStore::save(const Snapshot& snapshot) const {
  const std::string tmp = path_ + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out)
      throw SnapshotError("[SnapshotStore] cannot open " + tmp + " for writing");
    out << encode(snapshot);
    out.flush();
    if (!out)
      throw SnapshotError("[SnapshotStore] write to " + tmp + " failed");
  }
  if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
    const std::string reason = std::strerror(errno);
    std::remove(tmp.c_str());
    throw SnapshotError("[SnapshotStore] cannot replace " + path_ + ": " + reason);
  }
}

std::string SnapshotStore::quarantine() const {
  const std::string target = path_ + ".corrupt";
  if (std::rename(path_.c_str(), target.c_str()) != 0)
    throw SnapshotError("[SnapshotStore] cannot move " + path_ + " aside: " +
                        std::strerror(errno));
  return target;
}
