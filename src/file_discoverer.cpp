#include "file_discoverer.hpp"

#include <system_error>

FileDiscoverer::FileDiscoverer(DiscoveryOptions options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(std::move(logger)) {}

bool FileDiscoverer::accepts(const std::filesystem::directory_entry& entry) const {
  std::error_code ec;
  if(!entry.is_regular_file(ec) || ec) return false;
  const auto name = entry.path().filename().string();
  if(!options_.exclude_prefix.empty() && starts_with(name, options_.exclude_prefix)) {
    return false;
  }
  if(is_metadata_file(entry.path(), options_.rules)) return false;
  return true;
}

std::size_t FileDiscoverer::run(const std::filesystem::path& root, const Sink& sink) const {
  namespace fs = std::filesystem;
  std::error_code ec;
  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  if(ec) {
    log_error(logger_.get(), "Unable to scan {}: {}", root.string(), ec.message());
    return 0;
  }

  std::size_t emitted = 0;
  for(const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
    if(ec) {
      log_warn(logger_.get(), "Scan error under {}: {}", root.string(), ec.message());
      ec.clear();
      continue;
    }
    if(!accepts(*it)) continue;
    auto item = FileItem::from_path(fs::absolute(it->path()), options_.rules);
    log_debug(logger_.get(), "adding {}", item.source.string());
    ++emitted;
    sink(std::move(item));
  }
  return emitted;
}
