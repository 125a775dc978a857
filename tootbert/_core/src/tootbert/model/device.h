#pragma once

#include <string>
#include <vector>

namespace tootbert {
namespace model {

/**
 * Resolve a --device request to the device the run will use.
 *
 * "auto" picks the best available device; only the CPU backend is
 * compiled in, so it resolves to "cpu". The choice is made once at
 * startup and held for the whole run.
 *
 * @throws ValidationError for unknown names
 * @throws SetupError for known devices this build cannot use
 */
std::string resolve_device(const std::string& requested);

/// Devices this build can run on.
std::vector<std::string> available_devices();

}  // namespace model
}  // namespace tootbert
