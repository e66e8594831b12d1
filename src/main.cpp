#include <cpptrace/cpptrace.hpp>

#include <filesystem>
#include <memory>

#include "command_copy_client.hpp"
#include "command_line_parser.hpp"
#include "errors.hpp"
#include "http_catalog_client.hpp"
#include "log.hpp"
#include "pipeline.hpp"
#include "pipeline_config.hpp"
#include "settings_manager.hpp"
#include "single_file.hpp"

int main(int argc, char** argv){
  SettingsManager settings;
  settings.set_settings_path(std::filesystem::current_path() / ".config" / "settings.json");
  settings.load();

  CommandLineParser parser;
  try {
    parser.parse(argc, argv, settings);
  } catch(const ConfigError& e) {
    print_err(nullptr, "{}", e.what());
    parser.usage(settings);
    return 1;
  }
  if(settings.help_requested()) {
    parser.usage(settings);
    return 0;
  }

  try {
    init(settings.get<bool>("verbose"), settings.get<std::string>("log_file"));
    auto logger = std::make_shared<Logger>("sam_declare");

    if(settings.save_requested()) {
      if(!settings.save()) {
        logger->error("Unable to persist settings to {}", settings.settings_path().string());
      }
    }

    settings.load_environment();
    auto cfg = load_app_config(settings);
    logger->debug("Catalog {} copy command '{}'", cfg.catalog_url,
                  settings.get<std::string>("copy_command"));

    HttpCatalogClient::Options catalog_options;
    catalog_options.base_url = cfg.catalog_url;
    catalog_options.cert_file = cfg.catalog_cert;
    auto catalog = std::make_shared<HttpCatalogClient>(catalog_options, logger->child("catalog"));
    auto copier = std::make_shared<CommandCopyClient>(cfg.copy_command, logger->child("copy"));

    if(!cfg.recursive) {
      return run_single_file(cfg.pipeline, catalog, copier, logger);
    }

    Pipeline pipeline(cfg.pipeline, catalog, copier, logger);
    auto stats = pipeline.run();
    logger->print("{}", stats.summary());
    return 0;
  } catch(const ConfigError& e) {
    init(false);
    Logger logger("sam_declare");
    logger.error("{}", e.what());
    return 1;
  } catch(const std::exception& e) {
    init(false);
    Logger logger("sam_declare");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
