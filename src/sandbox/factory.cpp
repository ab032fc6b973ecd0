#include "sweguard/sandbox/factory.hpp"

#include "sweguard/common/fs.hpp"
#include "sweguard/sandbox/docker_runtime.hpp"
#include "sweguard/sandbox/local_runtime.hpp"

namespace sweguard::sandbox {

common::Result<std::shared_ptr<ISandboxRuntime>>
create_runtime(const config::SandboxConfig &config) {
  const std::string runtime = common::to_lower(common::trim(config.runtime));
  if (runtime == "docker") {
    return common::Result<std::shared_ptr<ISandboxRuntime>>::success(
        std::make_shared<DockerRuntime>(config));
  }
  if (runtime == "local") {
    return common::Result<std::shared_ptr<ISandboxRuntime>>::success(
        std::make_shared<LocalRuntime>(config));
  }
  return common::Result<std::shared_ptr<ISandboxRuntime>>::failure("unknown sandbox runtime: " +
                                                                   config.runtime);
}

} // namespace sweguard::sandbox
