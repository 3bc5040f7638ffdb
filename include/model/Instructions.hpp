#pragma once
/** @file  Instructions.hpp
 *  @brief Post-processing instructions carried by a transfer.
 *
 *  © 2025 ferry contributors — MIT-licensed.
 */

#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace ferry::model {

  /// Copy the generated manifest into the destination folder.
  struct DeliverManifest {
    std::string filename{ "manifest.json" };
  };

  /// Restrict the archive members unpacked by the Extract stage (empty = all).
  struct ExtractArchives {
    std::vector<std::string> members;
  };

  /// Any key we do not understand; kept verbatim and copied into the manifest.
  struct UnrecognizedInstruction {
    std::string kind;
    nlohmann::json body;
  };

  using Instruction = std::variant<DeliverManifest, ExtractArchives, UnrecognizedInstruction>;

  /**
 * @class Instructions
 * @brief Tagged union list parsed from the specification's JSON object.
 *
 *  * `parse()` throws core::InvalidInstructionsError on a malformed known kind.
 *  * `toJson()` gives back an object equivalent to what was parsed.
 */
  class Instructions {
  public:
    Instructions() = default;

    static Instructions parse(const nlohmann::json& raw);

    nlohmann::json toJson() const;

    const DeliverManifest* deliverManifest() const;
    const ExtractArchives* extractArchives() const;

    const std::vector<Instruction>& items() const { return items_; }
    bool empty() const { return items_.empty(); }

  private:
    template <typename T> const T* find() const {
      for (const auto& item : items_)
        if (const auto* hit = std::get_if<T>(&item))
          return hit;
      return nullptr;
    }

    std::vector<Instruction> items_;
  };

} // namespace ferry::model
