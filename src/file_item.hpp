#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "naming.hpp"

struct FileItem {
  std::filesystem::path source;
  std::string public_name;
  bool is_virtual = false;
  std::optional<nlohmann::json> metadata;

  static FileItem from_path(const std::filesystem::path& source, const NameRules& rules) {
    FileItem item;
    item.source = source;
    item.public_name = ::public_name(source, rules);
    item.is_virtual = is_virtual_name(item.public_name, rules);
    return item;
  }
};

// Pushed downstream in place of a skipped item so transfer workers keep
// waiting while stage 1 is still busy.
struct Heartbeat {};

using TransferItem = std::variant<FileItem, Heartbeat>;

inline bool is_heartbeat(const TransferItem& item) {
  return std::holds_alternative<Heartbeat>(item);
}
