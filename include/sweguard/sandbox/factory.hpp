#pragma once

#include "sweguard/common/result.hpp"
#include "sweguard/config/schema.hpp"
#include "sweguard/sandbox/runtime.hpp"

#include <memory>

namespace sweguard::sandbox {

/// Picks the substrate named by `sandbox.runtime`.
[[nodiscard]] common::Result<std::shared_ptr<ISandboxRuntime>>
create_runtime(const config::SandboxConfig &config);

} // namespace sweguard::sandbox
