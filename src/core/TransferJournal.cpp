/* @file TransferJournal.cpp
 * @brief CSV journal of completed transfers
 *
 * © 2025 ferry contributors — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <stdexcept>
#include <utility>

// ferry headers
#include "core/TransferJournal.hpp"

using namespace ferry::core;

namespace {

  constexpr const char* kHeader =
      "id,source,destination,orcid,created,completed,outcome,payload_bytes,files,manifest\n";

  std::string quoted(const std::string& field) {
    std::string out = "\"";
    for (char c : field) {
      if (c == '"')
        out += '"';
      out += c;
    }
    return out + '"';
  }

  bool isEmptyFile(const std::string& path) {
    std::ifstream in(path, std::ios::ate);
    return !in || in.tellg() == 0;
  }

} // namespace

TransferJournal::TransferJournal(std::string path) : path_(std::move(path)) {}

std::string TransferJournal::fileFor(const std::string& dataDir, const std::string& serviceName) {
  std::string dir = dataDir;
  if (!dir.empty() && dir.back() != '/')
    dir += '/';
  return serviceName.empty() ? dir + "journal.csv" : dir + "journal-" + serviceName + ".csv";
}

std::string TransferJournal::outcome(const model::Transfer& transfer) {
  if (transfer.canceled)
    return "canceled";
  return transfer.status.code == model::StatusCode::Succeeded ? "succeeded" : "failed";
}

std::string TransferJournal::formatRecord(const model::Transfer& t) {
  std::string row = model::toString(t.id);
  row += ',' + quoted(t.spec.source);
  row += ',' + quoted(t.spec.destination);
  row += ',' + quoted(t.spec.user.orcid);
  row += ',' + model::toRfc3339(t.created);
  row += ',' + model::toRfc3339(t.completed);
  row += ',' + outcome(t);
  row += ',' + std::to_string(t.payloadBytes);
  row += ',' + std::to_string(t.status.numFiles);
  row += ',' + quoted(t.manifestFile);
  row += '\n';
  return row;
}

void TransferJournal::open() {
  const bool fresh = isEmptyFile(path_);
  if (!file_.open(path_))
    throw std::runtime_error("[TransferJournal] cannot open " + path_);
  if (fresh)
    file_.write(kHeader);
}

void TransferJournal::record(const model::Transfer& transfer) {
  file_.write(formatRecord(transfer));
  file_.flush();
}

void TransferJournal::close() { file_.close(); }
