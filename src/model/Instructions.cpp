/* @file Instructions.cpp
 * @brief parsing and re-encoding of per-transfer instructions
 *
 * © 2025 ferry contributors — MIT-licensed.
 */

// STL headers
#include <type_traits>

// ferry headers
#include "model/Instructions.hpp"
#include "core/Errors.hpp"

using namespace ferry::model;
using ferry::core::InvalidInstructionsError;

namespace {

  constexpr const char* kDeliverManifest = "deliver_manifest";
  constexpr const char* kExtract = "extract";

  std::vector<std::string> memberList(const nlohmann::json& raw) {
    if (!raw.is_array())
      throw InvalidInstructionsError("'extract' members must be an array of strings");
    std::vector<std::string> members;
    for (const auto& m : raw) {
      if (!m.is_string() || m.get_ref<const std::string&>().empty())
        throw InvalidInstructionsError("'extract' members must be non-empty strings");
      members.push_back(m.get<std::string>());
    }
    return members;
  }

} // namespace

Instructions Instructions::parse(const nlohmann::json& raw) {
  Instructions out;
  if (raw.is_null())
    return out;
  if (!raw.is_object())
    throw InvalidInstructionsError("instructions must be a JSON object");

  for (const auto& [kind, body] : raw.items()) {
    if (kind == kDeliverManifest) {
      if (body.is_boolean()) {
        if (body.get<bool>())
          out.items_.emplace_back(DeliverManifest{});
      } else if (body.is_object()) {
        DeliverManifest deliver;
        if (body.contains("filename")) {
          const auto& name = body.at("filename");
          if (!name.is_string() || name.get_ref<const std::string&>().empty())
            throw InvalidInstructionsError("'deliver_manifest.filename' must be a non-empty string");
          deliver.filename = name.get<std::string>();
        }
        out.items_.emplace_back(std::move(deliver));
      } else {
        throw InvalidInstructionsError("'deliver_manifest' must be a boolean or an object");
      }
    } else if (kind == kExtract) {
      if (body.is_object()) {
        out.items_.emplace_back(
            ExtractArchives{ body.contains("members") ? memberList(body.at("members"))
                                                      : std::vector<std::string>{} });
      } else {
        out.items_.emplace_back(ExtractArchives{ memberList(body) });
      }
    } else {
      out.items_.emplace_back(UnrecognizedInstruction{ kind, body });
    }
  }
  return out;
}

nlohmann::json Instructions::toJson() const {
  auto j = nlohmann::json::object();
  for (const auto& item : items_) {
    std::visit(
        [&j](const auto& i) {
          using T = std::decay_t<decltype(i)>;
          if constexpr (std::is_same_v<T, DeliverManifest>) {
            j[kDeliverManifest] = { { "filename", i.filename } };
          } else if constexpr (std::is_same_v<T, ExtractArchives>) {
            j[kExtract] = { { "members", i.members } };
          } else {
            j[i.kind] = i.body;
          }
        },
        item);
  }
  return j;
}

const DeliverManifest* Instructions::deliverManifest() const { return find<DeliverManifest>(); }

const ExtractArchives* Instructions::extractArchives() const { return find<ExtractArchives>(); }
