#include "subprocess.hpp"

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <stdexcept>
#include <system_error>

namespace isofetch {
namespace utils {

namespace {

struct PipeFds {
  int read = -1;
  int write = -1;
  ~PipeFds() {
    if (read >= 0) ::close(read);
    if (write >= 0) ::close(write);
  }
};

}  // namespace

std::string joinCommand(const std::vector<std::string>& argv) {
  std::string cmd;
  for (const auto& arg : argv) {
    if (!cmd.empty()) cmd += ' ';
    cmd += arg;
  }
  return cmd;
}

ProcessResult runProcess(const std::vector<std::string>& argv) {
  if (argv.empty()) {
    throw std::invalid_argument("runProcess: empty command line");
  }

  // Everything the child touches is prepared before fork().
  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);

  PipeFds pipe_fds;
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    throw std::system_error(errno, std::generic_category(), "pipe2");
  }
  pipe_fds.read = fds[0];
  pipe_fds.write = fds[1];

  const pid_t pid = ::fork();
  if (pid < 0) {
    throw std::system_error(errno, std::generic_category(), "fork");
  }
  if (pid == 0) {
    ::dup2(pipe_fds.write, STDOUT_FILENO);
    ::dup2(pipe_fds.write, STDERR_FILENO);
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
    ::execvp(args[0], args.data());
    _exit(127);
  }

  ::close(pipe_fds.write);
  pipe_fds.write = -1;

  ProcessResult result;
  char buffer[4096];
  for (;;) {
    const ssize_t n = ::read(pipe_fds.read, buffer, sizeof(buffer));
    if (n > 0) {
      result.output.append(buffer, static_cast<size_t>(n));
    } else if (n == 0) {
      break;
    } else if (errno != EINTR) {
      break;
    }
  }

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw std::system_error(errno, std::generic_category(), "waitpid");
    }
  }
  if (WIFEXITED(status)) {
    result.exitCode = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exitCode = 128 + WTERMSIG(status);
  }
  return result;
}

}  // namespace utils
}  // namespace isofetch
