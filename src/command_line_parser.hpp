#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto SettingsManager entries. Options may be written --key,
// -alias or --key=value; bool options take an optional true/false literal.
// Bare words fill the positional keys in order, and "--" ends option parsing.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "sam_declare",
                             std::vector<std::string> positional_keys = {"source", "destination"});

  // Applies argv on top of whatever the settings already hold. Throws
  // ConfigError on unknown options, missing or bad values, or surplus words.
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void parse(const std::vector<std::string>& args, SettingsManager& settings) const;

  void usage(const SettingsManager& settings) const;

private:
  struct Cursor {
    const std::vector<std::string>& args;
    std::size_t next = 0;
    std::size_t positional = 0;
    bool options_done = false;
  };

  void take_option(Cursor& cursor, const std::string& token, SettingsManager& settings) const;
  void take_positional(Cursor& cursor, const std::string& token, SettingsManager& settings) const;
  static bool looks_like_option(const std::string& token);
  static bool is_bool_word(const std::string& token);

  std::string process_name_;
  std::vector<std::string> positional_keys_;
};
