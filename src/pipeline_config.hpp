#pragma once

#include <string>
#include <vector>

#include "naming.hpp"
#include "pipeline.hpp"
#include "settings_manager.hpp"

// Everything main() needs, resolved from settings the SettingsManager has
// already type- and range-checked.
struct AppConfig {
  PipelineOptions pipeline;
  bool recursive = false;
  bool verbose = false;
  std::string log_file;
  std::string catalog_url;
  std::string catalog_cert;
  std::vector<std::string> copy_command;
};

std::string default_catalog_url(const std::string& experiment);

NameRules name_rules_from_settings(const SettingsManager& settings);

// Throws ConfigError when source or destination is missing, or when no
// catalog URL can be derived.
AppConfig load_app_config(const SettingsManager& settings);
