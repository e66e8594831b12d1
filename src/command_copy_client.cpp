#include "command_copy_client.hpp"

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <stdexcept>
#include <system_error>

CommandCopyClient::CommandCopyClient(std::vector<std::string> argv, std::shared_ptr<Logger> logger)
  : argv_(std::move(argv)),
    logger_(std::move(logger)) {
  if(argv_.empty() || argv_.front().empty()) {
    throw std::invalid_argument("copy command must name a program");
  }
}

int CommandCopyClient::copy(const std::filesystem::path& source,
                            const std::filesystem::path& destination) {
  std::vector<std::string> argv_str = argv_;
  argv_str.push_back(source.string());
  argv_str.push_back(destination.string());

  // Built before fork so the child only calls async-signal-safe functions.
  std::vector<char*> args;
  args.reserve(argv_str.size() + 1);
  for(auto& s : argv_str) {
    args.push_back(s.data());
  }
  args.push_back(nullptr);

  log_debug(logger_.get(), "exec {} {} {}", argv_.front(), source.string(), destination.string());

  pid_t pid = ::fork();
  if(pid < 0) {
    throw std::system_error(errno, std::generic_category(), "fork failed");
  }
  if(pid == 0) {
    ::execvp(args[0], args.data());
    ::_exit(kExecFailed);
  }

  int status = 0;
  while(::waitpid(pid, &status, 0) < 0) {
    if(errno != EINTR) {
      throw std::system_error(errno, std::generic_category(), "waitpid failed");
    }
  }
  if(WIFEXITED(status)) return WEXITSTATUS(status);
  if(WIFSIGNALED(status)) {
    log_warn(logger_.get(), "{} killed by signal {}", argv_.front(), WTERMSIG(status));
    return 128 + WTERMSIG(status);
  }
  return status;
}
