#pragma once

namespace tootbert {

constexpr const char* kVersion = "0.1.0";

}  // namespace tootbert
