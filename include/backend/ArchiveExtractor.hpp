#pragma once
/** @file  ArchiveExtractor.hpp
 *  @brief Unpacks archive-bearing payloads once they reach the destination.
 *
 *  © 2025 ferry contributors — MIT-licensed.
 */

#include <string>
#include <vector>

namespace ferry::backend {

  class ArchiveExtractor {
  public:
    virtual ~ArchiveExtractor() = default;

    /**
     * @brief Unpacks `members` (all members if empty) of `archivePath` into
     *        `destinationDir`.
     * @returns paths of the extracted files, relative to `destinationDir`.
     */
    virtual std::vector<std::string> extract(const std::string& archivePath,
                                             const std::vector<std::string>& members,
                                             const std::string& destinationDir) = 0;
  };

} // namespace ferry::backend
