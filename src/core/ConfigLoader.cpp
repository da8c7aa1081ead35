/* @file ConfigLoader.cpp
 * @brief reads and parses the JSON settings file
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <utility>

// labsim headers
#include "core/ConfigLoader.hpp"
#include "core/Errors.hpp"

using namespace labsim::core;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

Value ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw ConfigurationError("[ConfigLoader] cannot open settings file '" + path_ + "'");

  Value settings;
  try {
    settings = Value::parse(in);
  } catch (const Value::parse_error& e) {
    throw ConfigurationError("[ConfigLoader] '" + path_ + "' is not valid JSON: " + e.what());
  }
  if (!settings.is_object())
    throw ConfigurationError("[ConfigLoader] '" + path_ + "' must contain a JSON object");
  return settings;
}
