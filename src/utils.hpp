#pragma once
#include <optional>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);

// Value of an environment variable that must be set (and, when expected is
// given, must equal it). Throws ConfigError otherwise.
std::string check_env(const std::string& name,
                      const std::optional<std::string>& expected = std::nullopt);

// Whitespace-separated words, e.g. "ifdh cp" -> {"ifdh", "cp"}.
std::vector<std::string> split_words(const std::string& text);
