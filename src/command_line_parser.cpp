#include "command_line_parser.hpp"

#include <cctype>

#include "errors.hpp"
#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name, std::vector<std::string> positional_keys)
  : process_name_(std::move(process_name)),
    positional_keys_(std::move(positional_keys)) {}

bool CommandLineParser::looks_like_option(const std::string& token) {
  if(token.size() < 2 || token[0] != '-') return false;
  // "-5" and "-.5" are values, not options
  const unsigned char second = static_cast<unsigned char>(token[1]);
  return second == '-' || second == '?' || std::isalpha(second);
}

bool CommandLineParser::is_bool_word(const std::string& token) {
  static const char* const kWords[] = {"true", "false", "on", "off", "yes", "no", "1", "0"};
  for(const char* word : kWords) {
    if(token == word) return true;
  }
  return false;
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  for(int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  parse(args, settings);
}

void CommandLineParser::parse(const std::vector<std::string>& args, SettingsManager& settings) const {
  Cursor cursor{args};
  while(cursor.next < args.size()) {
    const std::string& token = args[cursor.next++];
    if(!cursor.options_done && token == "--") {
      cursor.options_done = true;
    } else if(!cursor.options_done && looks_like_option(token)) {
      take_option(cursor, token, settings);
    } else {
      take_positional(cursor, token, settings);
    }
  }
}

void CommandLineParser::take_option(Cursor& cursor, const std::string& token, SettingsManager& settings) const {
  std::string name = token.substr(token.rfind("--", 0) == 0 ? 2 : 1);
  std::string value;
  bool inline_value = false;
  const auto eq = name.find('=');
  if(eq != std::string::npos) {
    value = name.substr(eq + 1);
    name.resize(eq);
    inline_value = true;
  }

  const auto key = settings.resolve_key(name);
  if(!key) {
    throw ConfigError("Unknown option " + token);
  }
  if(!inline_value) {
    const bool has_next = cursor.next < cursor.args.size();
    if(settings.is_bool_setting(*key)) {
      value = (has_next && is_bool_word(cursor.args[cursor.next])) ? cursor.args[cursor.next++] : "true";
    } else if(has_next) {
      value = cursor.args[cursor.next++];
    } else {
      throw ConfigError("Missing value for option " + token);
    }
  }

  std::string error;
  if(!settings.set_from_string(*key, value, error)) {
    throw ConfigError("Invalid value for " + *key + ": " + error);
  }
}

void CommandLineParser::take_positional(Cursor& cursor, const std::string& token, SettingsManager& settings) const {
  if(cursor.positional >= positional_keys_.size()) {
    throw ConfigError("Unexpected argument '" + token + "'");
  }
  const auto& key = positional_keys_[cursor.positional++];
  std::string error;
  if(!settings.set_from_string(key, token, error)) {
    throw ConfigError("Invalid value for " + key + " '" + token + "': " + error);
  }
}

void CommandLineParser::usage(const SettingsManager& settings) const {
  std::string synopsis = process_name_ + " [options]";
  for(const auto& key : positional_keys_) {
    synopsis += " <" + key + ">";
  }
  print_out(nullptr, "{} - declare files to the catalog and copy them to the destination", process_name_);
  print_out(nullptr, "Usage: {}", synopsis);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& line : settings.option_help()) {
    print_out(nullptr, "{}", line);
  }
  print_out(nullptr, "");
  print_out(nullptr, "Required environment:");
  for(const auto& name : settings.required_environment()) {
    print_out(nullptr, "  {}", name);
  }
}
