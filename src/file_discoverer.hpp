#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include "file_item.hpp"
#include "log.hpp"
#include "naming.hpp"

struct DiscoveryOptions {
  NameRules rules;
  // Derivative artifacts written next to the data; never declared.
  std::string exclude_prefix = "Supplemental";
};

class FileDiscoverer {
public:
  using Sink = std::function<void(FileItem)>;

  FileDiscoverer(DiscoveryOptions options, std::shared_ptr<Logger> logger = nullptr);

  // Walks root recursively and hands every qualifying file to sink as soon
  // as it is seen. Returns the number of files emitted.
  std::size_t run(const std::filesystem::path& root, const Sink& sink) const;

  bool accepts(const std::filesystem::directory_entry& entry) const;

private:
  DiscoveryOptions options_;
  std::shared_ptr<Logger> logger_;
};
