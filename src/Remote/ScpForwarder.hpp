#ifndef ISOFETCH_REMOTE_SCP_FORWARDER_HPP_
#define ISOFETCH_REMOTE_SCP_FORWARDER_HPP_

#include <string>
#include <vector>

#include "RemoteForwarder.hpp"

namespace isofetch {

class ScpForwarder final : public RemoteForwarder {
 public:
  struct Options {
    std::string scpProgram = "scp";
    std::string sshProgram = "ssh";
    int connectTimeoutSeconds = 5;
  };

  explicit ScpForwarder(RemoteTarget target);
  ScpForwarder(RemoteTarget target, Options options);

  ForwardResult forward(const std::string& localPath,
                        const std::string& filename) override;
  ForwardResult probe() override;
  ForwardResult prepare() override;
  // Legacy scp hands the remote path to the remote shell, so only names made
  // of characters that shell treats literally are relayed.
  bool acceptsFilename(const std::string& filename) const override;
  std::string describe() const override;

  const RemoteTarget& target() const { return target_; }

 private:
  std::vector<std::string> sshArgs() const;
  ForwardResult run(const std::vector<std::string>& argv,
                    const std::string& target) const;

  RemoteTarget target_;
  Options options_;
};

}  // namespace isofetch

#endif  // ISOFETCH_REMOTE_SCP_FORWARDER_HPP_
