#pragma once
/** @file  TransferJournal.hpp
 *  @brief Append-only CSV record of every transfer that reached a final state.
 *
 *  © 2025 ferry contributors — MIT-licensed.
 */

#include <string>

#include "io/FileLogger.hpp"
#include "model/Transfer.hpp"

namespace ferry::core {

  /**
 * @class TransferJournal
 * @brief One row per terminal transfer:
 *        id,source,destination,orcid,created,completed,outcome,payload_bytes,files,manifest
 *
 *  * A header row is written when the file is new.
 *  * Each row is flushed as soon as it is recorded.
 */
  class TransferJournal {
  public:
    explicit TransferJournal(std::string path);

    /// `<dataDir>/journal-<serviceName>.csv`, or `<dataDir>/journal.csv`.
    static std::string fileFor(const std::string& dataDir, const std::string& serviceName);

    /// "succeeded", "failed" or "canceled".
    static std::string outcome(const model::Transfer& transfer);

    static std::string formatRecord(const model::Transfer& transfer);

    /// Throws `std::runtime_error` if the file cannot be opened for appending.
    void open();
    void record(const model::Transfer& transfer);
    void close();

    const std::string& path() const { return path_; }

  private:
    std::string path_;
    io::FileLogger file_;
  };

} // namespace ferry::core
