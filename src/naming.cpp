#include "naming.hpp"

#include <algorithm>

bool starts_with(const std::string& value, const std::string& prefix) {
  return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

std::string public_name(const std::filesystem::path& source, const NameRules& rules) {
  std::string name = source.filename().string();
  for(const auto& [from, to] : rules.substitutions) {
    if(from.empty()) continue;
    std::size_t pos = 0;
    while((pos = name.find(from, pos)) != std::string::npos) {
      name.replace(pos, from.size(), to);
      pos += to.size();
    }
  }
  return name;
}

bool is_virtual_name(const std::string& name, const NameRules& rules) {
  return std::any_of(rules.virtual_prefixes.begin(), rules.virtual_prefixes.end(),
                     [&](const std::string& prefix){ return !prefix.empty() && starts_with(name, prefix); });
}

std::filesystem::path metadata_path(const std::filesystem::path& source, const NameRules& rules) {
  auto out = source;
  out += rules.metadata_suffix;
  return out;
}

bool is_metadata_file(const std::filesystem::path& path, const NameRules& rules) {
  const auto name = path.filename().string();
  const auto& suffix = rules.metadata_suffix;
  if(suffix.empty() || name.size() <= suffix.size()) return false;
  return name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::filesystem::path destination_dir(const std::filesystem::path& source,
                                      const std::filesystem::path& dest_base,
                                      const std::filesystem::path& relative_to) {
  if(relative_to.empty()) return dest_base;
  auto root = relative_to.lexically_normal();
  if(!root.has_filename() && root.has_parent_path()) root = root.parent_path();
  auto rel = source.parent_path().lexically_normal().lexically_relative(root);
  if(rel.empty() || rel == ".") return dest_base;
  if(starts_with(rel.generic_string(), "..")) return dest_base;
  return dest_base / rel;
}

std::filesystem::path destination_path(const std::filesystem::path& source,
                                       const std::filesystem::path& dest_base,
                                       const std::filesystem::path& relative_to,
                                       const NameRules& rules) {
  return destination_dir(source, dest_base, relative_to) / public_name(source, rules);
}
