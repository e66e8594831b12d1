#include "settings_manager.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include <spdlog/fmt/fmt.h>

#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace {

std::string lowered(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string trimmed(const std::string& value) {
  auto first = std::find_if(value.begin(), value.end(), [](unsigned char ch){ return !std::isspace(ch); });
  auto last = std::find_if(value.rbegin(), value.rend(), [](unsigned char ch){ return !std::isspace(ch); }).base();
  return first < last ? std::string(first, last) : std::string();
}

std::string display(const nlohmann::json& value) {
  if(value.is_string()) return value.get<std::string>();
  return value.dump();
}

} // namespace

SettingsManager::SettingsManager(const nlohmann::json& specification)
  : values_(nlohmann::json::object()) {
  for(const auto& raw : specification) {
    entries_.push_back(parse_entry(raw));
    values_[entries_.back().key] = entries_.back().default_value;
  }
}

SettingsManager::Entry SettingsManager::parse_entry(const nlohmann::json& raw) {
  Entry entry;
  entry.key = raw.at("key").get<std::string>();
  for(const auto& alias : raw.value("aliases", nlohmann::json::array())) {
    entry.aliases.push_back(lowered(alias.get<std::string>()));
  }
  entry.type = raw.at("type").get<std::string>();
  entry.default_value = raw.at("default");
  entry.description = raw.value("description", "");
  entry.persistent = raw.value("persistent", true);
  if(raw.contains("min")) entry.min = raw.at("min").get<double>();
  if(raw.contains("above")) entry.above = raw.at("above").get<double>();
  entry.nonempty = raw.value("nonempty", false);
  entry.shape = raw.value("shape", "");
  entry.env = raw.value("env", "");
  return entry;
}

const SettingsManager::Entry* SettingsManager::find(const std::string& token) const {
  const auto needle = lowered(token);
  for(const auto& entry : entries_) {
    if(needle == lowered(entry.key)) return &entry;
    if(std::find(entry.aliases.begin(), entry.aliases.end(), needle) != entry.aliases.end()) {
      return &entry;
    }
  }
  return nullptr;
}

std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  const auto* entry = find(token);
  if(!entry || !entry->env.empty()) return std::nullopt;
  return entry->key;
}

bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* entry = find(key);
  return entry && entry->type == "bool";
}

bool SettingsManager::set_from_string(const std::string& key, const std::string& value, std::string& error) {
  error.clear();
  const auto* entry = find(key);
  if(!entry || !entry->env.empty()) {
    error = "unknown setting";
    return false;
  }
  auto parsed = from_string(*entry, value, error);
  if(!error.empty()) return false;
  return store(*entry, std::move(parsed), error);
}

bool SettingsManager::set_from_json(const std::string& key, const nlohmann::json& value, std::string& error) {
  error.clear();
  const auto* entry = find(key);
  if(!entry || !entry->env.empty()) {
    error = "unknown setting";
    return false;
  }
  return store(*entry, value, error);
}

void SettingsManager::load_environment() {
  for(const auto& entry : entries_) {
    if(entry.env.empty()) continue;
    values_[entry.key] = check_env(entry.env);
  }
}

bool SettingsManager::store(const Entry& entry, nlohmann::json value, std::string& error) {
  if(!coerce(entry, value, error)) return false;
  if(!check_range(entry, value, error)) return false;
  if(!check_shape(entry, value, error)) return false;
  values_[entry.key] = std::move(value);
  return true;
}

bool SettingsManager::coerce(const Entry& entry, nlohmann::json& value, std::string& error) const {
  if(entry.type == "bool") {
    if(value.is_number_integer()) value = (value.get<int>() != 0);
    if(value.is_boolean()) return true;
    error = "expected boolean";
  } else if(entry.type == "int") {
    if(value.is_number_integer()) return true;
    error = "expected integer";
  } else if(entry.type == "float") {
    if(value.is_number()) {
      value = value.get<double>();
      return true;
    }
    error = "expected number";
  } else if(entry.type == "string") {
    if(value.is_string()) return true;
    error = "expected string";
  } else if(entry.type == "json") {
    return true;
  } else {
    error = "unknown type " + entry.type;
  }
  return false;
}

bool SettingsManager::check_range(const Entry& entry, const nlohmann::json& value, std::string& error) const {
  if(value.is_number()) {
    const double number = value.get<double>();
    if(entry.min && number < *entry.min) {
      error = fmt::format("must be >= {} (got {})", *entry.min, value.dump());
      return false;
    }
    if(entry.above && !(number > *entry.above)) {
      error = fmt::format("must be > {} (got {})", *entry.above, value.dump());
      return false;
    }
  }
  if(entry.nonempty && value.is_string() && trimmed(value.get<std::string>()).empty()) {
    error = "must not be empty";
    return false;
  }
  return true;
}

bool SettingsManager::check_shape(const Entry& entry, const nlohmann::json& value, std::string& error) const {
  if(entry.shape.empty()) return true;
  if(entry.shape == "object") {
    if(value.is_object()) return true;
    error = "must be a JSON object";
    return false;
  }
  if(!value.is_array()) {
    error = "must be a JSON array";
    return false;
  }
  for(const auto& item : value) {
    if(entry.shape == "string_list" && !item.is_string()) {
      error = "must be a JSON array of strings";
      return false;
    }
    if(entry.shape == "pair_list" &&
       !(item.is_array() && item.size() == 2 && item[0].is_string() && item[1].is_string())) {
      error = "entries must be [from, to] string pairs";
      return false;
    }
  }
  return true;
}

nlohmann::json SettingsManager::from_string(const Entry& entry, const std::string& text, std::string& error) const {
  const auto clean = trimmed(text);
  if(entry.type == "bool") {
    const auto v = lowered(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(entry.type == "string") return clean;
  try {
    if(entry.type == "json") return nlohmann::json::parse(clean);
    std::size_t used = 0;
    nlohmann::json out;
    if(entry.type == "int") {
      out = std::stoi(clean, &used);
    } else {
      out = std::stod(clean, &used);
    }
    if(used != clean.size()) {
      error = "trailing characters in '" + clean + "'";
      return {};
    }
    return out;
  } catch(const std::exception& e) {
    error = std::string("cannot parse '") + clean + "': " + e.what();
    return {};
  }
}

void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_ = path;
}

std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_.empty()) return settings_path_;
  return std::filesystem::current_path() / ".config" / "settings.json";
}

bool SettingsManager::load() {
  const auto path = settings_path();
  std::ifstream in(path);
  if(!in) return false;
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const std::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) {
    print_err(nullptr, "Ignoring {}: not a JSON object", path.string());
    return false;
  }
  for(const auto& item : doc.items()) {
    std::string error;
    if(!set_from_json(item.key(), item.value(), error)) {
      print_err(nullptr, "Ignoring setting '{}' in {}: {}", item.key(), path.string(), error);
    }
  }
  return true;
}

nlohmann::json SettingsManager::persistent_values() const {
  auto doc = nlohmann::json::object();
  for(const auto& entry : entries_) {
    if(entry.persistent) doc[entry.key] = values_.at(entry.key);
  }
  return doc;
}

bool SettingsManager::save() const {
  const auto path = settings_path();
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << persistent_values().dump(2) << "\n";
  return static_cast<bool>(out);
}

std::vector<std::string> SettingsManager::option_help() const {
  std::vector<std::string> lines;
  for(const auto& entry : entries_) {
    if(!entry.env.empty()) continue;
    std::string names = "--" + entry.key;
    for(const auto& alias : entry.aliases) {
      names += (alias.size() == 1 ? ", -" : ", --") + alias;
    }
    const std::string hint = (entry.type == "bool") ? "" : " <" + entry.type + ">";
    lines.push_back(fmt::format("  {}{}", names, hint));
    lines.push_back(fmt::format("      {} (default: {})", entry.description, display(entry.default_value)));
  }
  return lines;
}

std::vector<std::string> SettingsManager::required_environment() const {
  std::vector<std::string> names;
  for(const auto& entry : entries_) {
    if(!entry.env.empty()) names.push_back(entry.env);
  }
  return names;
}
