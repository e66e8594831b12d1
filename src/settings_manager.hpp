#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// One entry per setting. Besides key/aliases/type/default/description and
// persistent, an entry may carry:
//   min       inclusive lower bound for int and float values
//   above     exclusive lower bound for float values
//   nonempty  string must not be blank
//   shape     json layout: "string_list", "pair_list" or "object"
//   env       filled from this environment variable by load_environment(),
//             never from the command line or the settings file
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","source"},                   {"aliases", {"src"}},         {"type","string"}, {"default",""},    {"description","File, or directory with -r, to declare and transfer"}, {"persistent", false}},
  {{"key","destination"},              {"aliases", {"dest"}},        {"type","string"}, {"default",""},    {"description","Destination base directory"}},
  {{"key","recursive"},                {"aliases", {"r"}},           {"type","bool"},   {"default",false}, {"description","Treat source as a directory and run the pipeline over it"}, {"persistent", false}},
  {{"key","validate"},                 {"aliases", {"v"}},           {"type","bool"},   {"default",false}, {"description","Validate metadata before declaring"}},
  {{"key","delete"},                   {"aliases", {"d"}},           {"type","bool"},   {"default",false}, {"description","Remove file and metadata file after declaration and transfer"}, {"persistent", false}},
  {{"key","verbose"},                  {"aliases", {"debug"}},       {"type","bool"},   {"default",false}, {"description","Enable debug output on the console"}},
  {{"key","log_file"},                 {"aliases", {"log"}},         {"type","string"}, {"default","sam_declare.log"}, {"description","Append debug log to this file (empty disables)"}},
  {{"key","catalog_url"},              {"aliases", {"catalog"}},     {"type","string"}, {"default",""},    {"description","Catalog API base URL (default derived from EXPERIMENT)"}},
  {{"key","catalog_cert"},             {"aliases", {"cert"}},        {"type","string"}, {"default",""},    {"description","PEM certificate+key for https catalog access"}},
  {{"key","copy_command"},             {"aliases", {"cp"}},          {"type","string"}, {"default","ifdh cp"}, {"nonempty", true}, {"description","Copy program; source and destination are appended"}},
  {{"key","already_present_code"},     {"aliases", {"apc"}},         {"type","int"},    {"default",17},    {"description","Copy exit code meaning the file is already at the destination"}},
  {{"key","max_declare_workers"},      {"aliases", {"mdw"}},         {"type","int"},    {"default",4},     {"min",1}, {"description","Ceiling on concurrent declare workers"}},
  {{"key","max_transfer_workers"},     {"aliases", {"mtw"}},         {"type","int"},    {"default",10},    {"min",1}, {"description","Ceiling on concurrent transfer workers"}},
  {{"key","spawn_batch_size"},         {"aliases", {"batch"}},       {"type","int"},    {"default",10},    {"min",1}, {"description","Files to accumulate before spawning another worker"}},
  {{"key","max_requests_per_second"},  {"aliases", {"rps"}},         {"type","float"},  {"default",5.0},   {"above",0}, {"description","Catalog requests per second, per declare worker"}},
  {{"key","request_smear"},            {"aliases", {"smear"}},       {"type","float"},  {"default",1.1},   {"min",1}, {"description","Upper bound of the random rate-limit stretch factor"}},
  {{"key","declare_idle_timeout_ms"},  {"aliases", {"dit"}},         {"type","int"},    {"default",10000}, {"min",1}, {"description","Declare worker exits after this long without input"}},
  {{"key","transfer_idle_timeout_ms"}, {"aliases", {"tit"}},         {"type","int"},    {"default",30000}, {"min",1}, {"description","Transfer worker exits after this long without input"}},
  {{"key","declare_start_jitter_ms"},  {"aliases", {"dsj"}},         {"type","int"},    {"default",5000},  {"min",0}, {"description","Maximum random delay before a declare worker starts"}},
  {{"key","transfer_start_delay_ms"},  {"aliases", {"tsd"}},         {"type","int"},    {"default",5000},  {"min",0}, {"description","Delay before a transfer worker starts polling"}},
  {{"key","max_worker_restarts"},      {"aliases", {"restarts"}},    {"type","int"},    {"default",0},     {"min",0}, {"description","Restarts allowed for a worker killed by an unexpected error"}},
  {{"key","exclude_prefix"},           {"aliases", {"exclude"}},     {"type","string"}, {"default","Supplemental"}, {"description","Skip files whose name starts with this"}},
  {{"key","metadata_suffix"},          {"aliases", {"meta_suffix"}}, {"type","string"}, {"default",".json"}, {"nonempty", true}, {"description","Sidecar suffix appended to the data file name"}},
  {{"key","name_substitutions"},       {"aliases", {"rename"}},      {"type","json"},   {"shape","pair_list"}, {"default", nlohmann::json::array({{"reco1","stage0"}, {"reco2","stage1"}, {"Supplemental","hist"}})}, {"description","[[from,to],...] applied to file names before declaring"}},
  {{"key","virtual_prefixes"},         {"aliases", {"virtual"}},     {"type","json"},   {"shape","string_list"}, {"default", nlohmann::json::array({"stage1","reco2"})}, {"description","Names that are declared but never transferred"}},
  {{"key","metadata_overrides"},       {"aliases", {"overrides"}},   {"type","json"},   {"shape","object"}, {"default", {{"file_format","artroot"}, {"file_type","data"}, {"data_tier","reconstructed"}, {"production.type","aurora"}}}, {"description","Fields merged over every sidecar (null removes)"}},
  {{"key","stage_overrides"},          {"aliases", {"stages"}},      {"type","json"},   {"shape","object"}, {"default", {{"reco2", {{"application", {{"family","art"}, {"name","stage1_caf_larcv"}, {"version","v10_06_00_10"}}}, {"fcl.name","stage0_run2_wcdnn_icarus.fcl"}, {"icarus_project.stage","stage1"}, {"parents", nullptr}}}}}, {"description","Per source-name prefix field overrides"}},
  {{"key","unsupported_prefixes"},     {"aliases", {"unsupported"}}, {"type","json"},   {"shape","string_list"}, {"default", nlohmann::json::array({"hist"})}, {"description","Source names we refuse to build metadata for"}},
  {{"key","experiment"},               {"env","EXPERIMENT"},         {"type","string"}, {"default",""},    {"description","Experiment name, selects the default catalog URL"}, {"persistent", false}},
  {{"key","ifdh_cp_maxretries"},       {"env","IFDH_CP_MAXRETRIES"}, {"type","string"}, {"default",""},    {"description","Retry count the copy tool reads from its environment"}, {"persistent", false}},
  {{"key","help"},                     {"aliases", {"h","?"}},       {"type","bool"},   {"default",false}, {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                     {"aliases", {"persist"}},     {"type","bool"},   {"default",false}, {"description","Persist current settings to disk"}, {"persistent", false}}
});

// Typed, range-checked settings for one invocation. Values come from the
// specification defaults, then the settings file, then argv, then the
// environment for "env" entries.
class SettingsManager {
public:
  explicit SettingsManager(const nlohmann::json& specification = SETTINGS_SPECIFICATION);

  template<typename T>
  T get(const std::string& key) const {
    if(!values_.contains(key)) {
      throw std::runtime_error("Unknown setting: " + key);
    }
    return values_.at(key).get<T>();
  }

  // Both return false and fill error for an unknown key, an environment-only
  // key, a value of the wrong type, or one outside the entry's range.
  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  // Throws ConfigError naming the first unset variable.
  void load_environment();

  // A missing settings file is not an error; unreadable entries are reported
  // and skipped.
  bool load();
  bool save() const;
  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  bool save_requested() const { return get<bool>("save"); }
  bool help_requested() const { return get<bool>("help"); }

  // Canonical key for a command-line token, or nullopt.
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  // Option lines for usage output, then the required environment.
  std::vector<std::string> option_help() const;
  std::vector<std::string> required_environment() const;

private:
  struct Entry {
    std::string key;
    std::vector<std::string> aliases;
    std::string type;
    nlohmann::json default_value;
    std::string description;
    bool persistent = true;
    std::optional<double> min;
    std::optional<double> above;
    bool nonempty = false;
    std::string shape;
    std::string env;
  };

  static Entry parse_entry(const nlohmann::json& raw);
  const Entry* find(const std::string& token) const;

  bool store(const Entry& entry, nlohmann::json value, std::string& error);
  bool coerce(const Entry& entry, nlohmann::json& value, std::string& error) const;
  bool check_range(const Entry& entry, const nlohmann::json& value, std::string& error) const;
  bool check_shape(const Entry& entry, const nlohmann::json& value, std::string& error) const;
  nlohmann::json from_string(const Entry& entry, const std::string& text, std::string& error) const;
  nlohmann::json persistent_values() const;

  std::vector<Entry> entries_;
  nlohmann::json values_;
  std::filesystem::path settings_path_;
};
