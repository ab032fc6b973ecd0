#pragma once

#include "sweguard/config/schema.hpp"
#include "sweguard/sandbox/process.hpp"
#include "sweguard/sandbox/runtime.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sweguard::sandbox {

/// One container per sandbox, driven through the docker CLI.
class DockerRuntime final : public ISandboxRuntime {
public:
  explicit DockerRuntime(config::SandboxConfig config,
                         std::shared_ptr<IProcessRunner> runner =
                             std::make_shared<PosixProcessRunner>());

  [[nodiscard]] common::Result<CloneOutcome> clone_repository(const CloneRequest &request) override;
  [[nodiscard]] common::Status set_read_only(const RuntimeHandle &handle, bool read_only) override;
  [[nodiscard]] common::Result<ExecResult> execute(const RuntimeHandle &handle,
                                                   const ExecRequest &request) override;
  [[nodiscard]] common::Result<RuntimeHandle> snapshot(const RuntimeHandle &source,
                                                       const std::string &sandbox_id) override;
  [[nodiscard]] common::Status destroy(const RuntimeHandle &handle) override;
  [[nodiscard]] std::string_view name() const override { return "docker"; }

  [[nodiscard]] std::string image_for(const std::string &runtime_version) const;
  [[nodiscard]] std::string container_name(const std::string &sandbox_id) const;
  [[nodiscard]] std::vector<std::string> build_run_args(const std::string &container,
                                                        const std::string &image,
                                                        bool network) const;
  /// Agent commands run as `sandbox.user`; `privileged` ones (clone, setup, chmod) as root.
  [[nodiscard]] std::vector<std::string> build_exec_args(const RuntimeHandle &handle,
                                                         const ExecRequest &request,
                                                         bool privileged = false) const;

private:
  [[nodiscard]] common::Status ensure_image(const std::string &image,
                                            const std::string &runtime_version);
  [[nodiscard]] common::Result<ProcessResult> docker(std::vector<std::string> args,
                                                     ProcessOptions options = {});
  [[nodiscard]] common::Result<ProcessResult> exec_script(const RuntimeHandle &handle,
                                                          const std::string &script,
                                                          const std::filesystem::path &workdir,
                                                          std::chrono::milliseconds timeout,
                                                          const common::CancellationToken &cancel);

  config::SandboxConfig config_;
  std::shared_ptr<IProcessRunner> runner_;
  std::mutex image_mutex_;
};

/// Lower-case docker-safe form of an identifier.
[[nodiscard]] std::string docker_safe_name(const std::string &value);

} // namespace sweguard::sandbox
