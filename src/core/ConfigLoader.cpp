/* @file ConfigLoader.cpp
 * @brief JSON config file reader
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <stdexcept>
#include <utility>

// 3rd party headers
#include <nlohmann/json.hpp>

#include "core/ConfigLoader.hpp"

using namespace retro::core;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

nlohmann::json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open config file: " + path_);

  try {
    nlohmann::json doc = nlohmann::json::parse(in);
    if (!doc.is_object())
      throw std::runtime_error("[ConfigLoader] config root must be a JSON object: " + path_);
    return doc;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] malformed JSON in " + path_ + ": " + e.what());
  }
}
