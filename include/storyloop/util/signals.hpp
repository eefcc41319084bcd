#pragma once

#include "storyloop/core/error.hpp"

namespace storyloop {

// Installs SIGINT/SIGTERM handlers for a graceful stop. The first signal
// only records a shutdown request for the orchestrator loop to observe; a
// second one restores the default disposition and re-raises, so an
// operator can always force the process down.
[[nodiscard]] auto install_shutdown_handlers() -> Result<void>;

[[nodiscard]] auto shutdown_requested() noexcept -> bool;

// Number of the first signal received, or 0.
[[nodiscard]] auto shutdown_signal() noexcept -> int;

auto clear_shutdown_request() noexcept -> void;

}  // namespace storyloop
