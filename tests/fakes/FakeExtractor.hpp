#pragma once
/** @file  FakeExtractor.hpp
 *  @brief ArchiveExtractor that records its calls and returns a fixed file list.
 *
 *  © 2025 ferry contributors — MIT-licensed.
 */

#include <string>
#include <vector>

#include "backend/ArchiveExtractor.hpp"

namespace ferry {
  namespace test {

    class FakeExtractor : public ferry::backend::ArchiveExtractor {
    public:
      struct Call {
        std::string archive;
        std::vector<std::string> members;
        std::string destination;
      };

      std::vector<std::string> produces{ "readme.txt", "data/table.csv" };
      std::vector<Call> calls;

      std::vector<std::string> extract(const std::string& archivePath,
                                       const std::vector<std::string>& members,
                                       const std::string& destinationDir) override {
        calls.push_back({ archivePath, members, destinationDir });
        return produces;
      }
    };

  } // namespace test
} // namespace ferry
