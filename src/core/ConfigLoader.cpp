/* @file ConfigLoader.cpp
 * @brief reads + env-expands + parses the JSON config file
 *
 * © 2025 ferry contributors — MIT-licensed.
 */

// STL headers
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

// nlohmann headers
#include <nlohmann/json.hpp>

// ferry headers
#include "core/ConfigLoader.hpp"

using namespace ferry::core;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

nlohmann::json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open config file: " + path_);

  std::stringstream raw;
  raw << in.rdbuf();

  try {
    return nlohmann::json::parse(expandEnvironment(raw.str()));
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] " + path_ + ": " + e.what());
  }
}

std::string ConfigLoader::expandEnvironment(const std::string& text) {
  std::string out;
  out.reserve(text.size());

  std::size_t pos = 0;
  while (pos < text.size()) {
    auto open = text.find("${", pos);
    if (open == std::string::npos) {
      out.append(text, pos, std::string::npos);
      break;
    }
    auto close = text.find('}', open + 2);
    if (close == std::string::npos) { // unterminated, keep verbatim
      out.append(text, pos, std::string::npos);
      break;
    }
    out.append(text, pos, open - pos);
    const std::string name = text.substr(open + 2, close - open - 2);
    if (const char* value = std::getenv(name.c_str()))
      out += value;
    pos = close + 1;
  }
  return out;
}
