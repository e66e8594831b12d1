#pragma once

#include <filesystem>

// Remote copy service. The returned status is the tool's exit code: 0 is
// success, one reserved code means the file is already at the destination,
// everything else is a failure.
class CopyClient {
public:
  virtual ~CopyClient() = default;

  virtual int copy(const std::filesystem::path& source,
                   const std::filesystem::path& destination) = 0;
};
