#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

// Pure path/name transformations. Nothing here touches the filesystem.
struct NameRules {
  // Applied in order to the file name, every occurrence replaced.
  std::vector<std::pair<std::string, std::string>> substitutions = {
    {"reco1", "stage0"},
    {"reco2", "stage1"},
    {"Supplemental", "hist"}
  };
  // Public names starting with any of these are catalog-only.
  std::vector<std::string> virtual_prefixes = {"stage1", "reco2"};
  std::string metadata_suffix = ".json";
};

std::string public_name(const std::filesystem::path& source, const NameRules& rules);

bool is_virtual_name(const std::string& name, const NameRules& rules);

// a/b/file.root -> a/b/file.root.json
std::filesystem::path metadata_path(const std::filesystem::path& source, const NameRules& rules);

bool is_metadata_file(const std::filesystem::path& path, const NameRules& rules);

// Directory the file lands in: dest_base / (source parent relative to root).
// A source outside relative_to keeps only dest_base.
std::filesystem::path destination_dir(const std::filesystem::path& source,
                                      const std::filesystem::path& dest_base,
                                      const std::filesystem::path& relative_to);

// destination_dir(...) / public_name(source)
std::filesystem::path destination_path(const std::filesystem::path& source,
                                       const std::filesystem::path& dest_base,
                                       const std::filesystem::path& relative_to,
                                       const NameRules& rules);

bool starts_with(const std::string& value, const std::string& prefix);
