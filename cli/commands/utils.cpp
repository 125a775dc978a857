#include "commands.h"
#include "tootbert/dispatch/scalar_traits.h"
#include "tootbert/model/device.h"
#include "tootbert/primitives/gemm/thread_utils.h"
#include "tootbert/version.h"
#include <iostream>

namespace tootbert {
namespace commands {

int version() {
    std::cout << "tootbert " << kVersion << std::endl;
    std::cout << "Backend: " << BackendTraits<ScalarBackend>::name << std::endl;
    std::cout << "Compiler: " << __VERSION__ << std::endl;

    std::cout << "Devices:";
    for (const auto& device : model::available_devices()) {
        std::cout << " " << device;
    }
    std::cout << std::endl;

#ifdef _OPENMP
    std::cout << "OpenMP: yes (" << gemm::get_thread_count() << " threads)" << std::endl;
#else
    std::cout << "OpenMP: no" << std::endl;
#endif
    return 0;
}

}  // namespace commands
}  // namespace tootbert
