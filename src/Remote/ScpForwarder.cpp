#include "ScpForwarder.hpp"

#include <cctype>
#include <system_error>
#include <utility>

#include "logger.hpp"
#include "subprocess.hpp"

namespace isofetch {

namespace {

std::string trimTrailing(std::string text) {
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r' ||
                           text.back() == ' ')) {
    text.pop_back();
  }
  return text;
}

// Quotes for the remote login shell that ssh hands the command to.
std::string shellQuote(const std::string& arg) {
  std::string quoted = "'";
  for (char c : arg) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}

}  // namespace

ScpForwarder::ScpForwarder(RemoteTarget target)
    : ScpForwarder(std::move(target), Options()) {}

ScpForwarder::ScpForwarder(RemoteTarget target, Options options)
    : target_(std::move(target)), options_(std::move(options)) {}

std::string ScpForwarder::describe() const { return target_.toString(); }

std::vector<std::string> ScpForwarder::sshArgs() const {
  return {"-o", "BatchMode=yes", "-o",
          "ConnectTimeout=" + std::to_string(options_.connectTimeoutSeconds)};
}

ForwardResult ScpForwarder::run(const std::vector<std::string>& argv,
                                const std::string& target) const {
  LOG(DEBUG) << "Running: " << utils::joinCommand(argv);
  utils::ProcessResult result;
  try {
    result = utils::runProcess(argv);
  } catch (const std::system_error& e) {
    return utils::makeUnexpected(ForwardError{target, -1, e.what()});
  }
  if (result.exitCode != 0) {
    std::string diagnostic = trimTrailing(result.output);
    if (result.exitCode == 127 && diagnostic.empty()) {
      diagnostic = argv.front() + ": command not found";
    }
    return utils::makeUnexpected(
        ForwardError{target, result.exitCode, std::move(diagnostic)});
  }
  return utils::Ok{};
}

bool ScpForwarder::acceptsFilename(const std::string& filename) const {
  if (filename.empty() || filename.front() == '-') return false;
  for (unsigned char c : filename) {
    if (!std::isalnum(c) && c != '.' && c != '_' && c != '-' && c != '+' &&
        c != ',' && c != '=' && c != '@' && c != '%') {
      return false;
    }
  }
  return true;
}

ForwardResult ScpForwarder::forward(const std::string& localPath,
                                    const std::string& filename) {
  const std::string remote_file = target_.fileSpec(filename);
  if (!acceptsFilename(filename)) {
    return utils::makeUnexpected(ForwardError{
        remote_file, -1, "file name contains characters unsafe for scp"});
  }
  std::vector<std::string> argv{options_.scpProgram, "-q"};
  for (auto& arg : sshArgs()) argv.push_back(std::move(arg));
  argv.push_back(localPath);
  argv.push_back(remote_file);

  LOG(INFO) << "Transferring " << filename << " to " << remote_file << "...";
  auto result = run(argv, remote_file);
  if (result) {
    LOG(INFO) << "Successfully transferred " << filename << " to "
              << target_.host;
  }
  return result;
}

ForwardResult ScpForwarder::probe() {
  std::vector<std::string> argv{options_.sshProgram};
  for (auto& arg : sshArgs()) argv.push_back(std::move(arg));
  argv.push_back(target_.host);
  argv.push_back("true");
  return run(argv, target_.host);
}

ForwardResult ScpForwarder::prepare() {
  if (target_.path.empty()) return utils::Ok{};
  std::vector<std::string> argv{options_.sshProgram};
  for (auto& arg : sshArgs()) argv.push_back(std::move(arg));
  argv.push_back(target_.host);
  argv.push_back("mkdir -p -- " + shellQuote(target_.path));
  return run(argv, target_.toString());
}

}  // namespace isofetch
