/* @file ConfigLoader.cpp
 * @brief JSON file -> nlohmann::json, errors as std::runtime_error
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <stdexcept>

// 3rd-party headers
#include <nlohmann/json.hpp>

// cloneflow headers
#include "core/ConfigLoader.hpp"

using namespace cloneflow::core;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

nlohmann::json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open " + path_);

  try {
    auto doc = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/true, /*ignore_comments=*/true);
    if (!doc.is_object())
      throw std::runtime_error("[ConfigLoader] " + path_ + ": top level must be an object");
    return doc;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] " + path_ + ": " + e.what());
  }
}
