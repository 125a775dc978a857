#include "device.h"
#include "tootbert/dispatch/scalar_traits.h"
#include "tootbert/errors/messages.h"

namespace tootbert {
namespace model {

std::vector<std::string> available_devices() {
    return {BackendTraits<ScalarBackend>::device};
}

std::string resolve_device(const std::string& requested) {
    const std::string cpu = BackendTraits<ScalarBackend>::device;

    if (requested == "auto" || requested == cpu) {
        return cpu;
    }
    if (requested == "cuda" || requested.rfind("cuda:", 0) == 0 || requested == "mps") {
        throw errors::SetupError("embedding model",
                                 "device '" + requested + "' is not available in this build",
                                 "Use --device cpu or --device auto");
    }
    throw errors::messages::invalid_enum_value("device", requested, {"auto", "cpu"});
}

}  // namespace model
}  // namespace tootbert
