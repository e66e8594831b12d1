#include "pipeline_config.hpp"

#include "errors.hpp"
#include "utils.hpp"

namespace {

std::size_t count_setting(const SettingsManager& settings, const std::string& key) {
  return static_cast<std::size_t>(settings.get<int>(key));
}

std::chrono::milliseconds ms_setting(const SettingsManager& settings, const std::string& key) {
  return std::chrono::milliseconds(settings.get<int>(key));
}

} // namespace

std::string default_catalog_url(const std::string& experiment) {
  return "https://samweb.fnal.gov:8483/sam/" + experiment + "/api";
}

NameRules name_rules_from_settings(const SettingsManager& settings) {
  NameRules rules;
  rules.substitutions.clear();
  for(const auto& pair : settings.get<nlohmann::json>("name_substitutions")) {
    rules.substitutions.emplace_back(pair[0].get<std::string>(), pair[1].get<std::string>());
  }
  rules.virtual_prefixes = settings.get<std::vector<std::string>>("virtual_prefixes");
  rules.metadata_suffix = settings.get<std::string>("metadata_suffix");
  return rules;
}

AppConfig load_app_config(const SettingsManager& settings) {
  AppConfig cfg;
  auto& p = cfg.pipeline;

  p.source_root = settings.get<std::string>("source");
  p.destination = settings.get<std::string>("destination");
  if(p.source_root.empty()) throw ConfigError("No source given");
  if(p.destination.empty()) throw ConfigError("No destination given");

  p.validate = settings.get<bool>("validate");
  p.delete_after = settings.get<bool>("delete");
  p.max_declare_workers = count_setting(settings, "max_declare_workers");
  p.max_transfer_workers = count_setting(settings, "max_transfer_workers");
  p.spawn_batch_size = count_setting(settings, "spawn_batch_size");
  p.max_requests_per_second = settings.get<double>("max_requests_per_second");
  p.request_smear = settings.get<double>("request_smear");
  p.declare_idle_timeout = ms_setting(settings, "declare_idle_timeout_ms");
  p.transfer_idle_timeout = ms_setting(settings, "transfer_idle_timeout_ms");
  p.declare_start_jitter = ms_setting(settings, "declare_start_jitter_ms");
  p.transfer_start_delay = ms_setting(settings, "transfer_start_delay_ms");
  p.already_present_code = settings.get<int>("already_present_code");
  p.max_worker_restarts = count_setting(settings, "max_worker_restarts");

  p.rules = name_rules_from_settings(settings);
  p.exclude_prefix = settings.get<std::string>("exclude_prefix");
  p.metadata.rules = p.rules;
  p.metadata.overrides = settings.get<nlohmann::json>("metadata_overrides");
  p.metadata.stage_overrides = settings.get<nlohmann::json>("stage_overrides");
  p.metadata.unsupported_prefixes = settings.get<std::vector<std::string>>("unsupported_prefixes");

  cfg.recursive = settings.get<bool>("recursive");
  cfg.verbose = settings.get<bool>("verbose");
  cfg.log_file = settings.get<std::string>("log_file");
  cfg.catalog_url = settings.get<std::string>("catalog_url");
  if(cfg.catalog_url.empty()) {
    const auto experiment = settings.get<std::string>("experiment");
    if(experiment.empty()) throw ConfigError("No catalog_url given and EXPERIMENT is not set");
    cfg.catalog_url = default_catalog_url(experiment);
  }
  cfg.catalog_cert = settings.get<std::string>("catalog_cert");
  cfg.copy_command = split_words(settings.get<std::string>("copy_command"));
  return cfg;
}
