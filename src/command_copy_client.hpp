#pragma once

#include <memory>
#include <string>
#include <vector>

#include "copy_client.hpp"
#include "log.hpp"

// Runs an external copy tool as "<argv...> <source> <destination>" and
// returns its exit status. The default is ifdh, whose retry count comes from
// IFDH_CP_MAXRETRIES in the inherited environment.
class CommandCopyClient : public CopyClient {
public:
  static constexpr int kExecFailed = 127;

  explicit CommandCopyClient(std::vector<std::string> argv = {"ifdh", "cp"},
                             std::shared_ptr<Logger> logger = nullptr);

  int copy(const std::filesystem::path& source,
           const std::filesystem::path& destination) override;

  const std::vector<std::string>& argv() const { return argv_; }

private:
  std::vector<std::string> argv_;
  std::shared_ptr<Logger> logger_;
};
