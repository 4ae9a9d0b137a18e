#pragma once

#include <cstdlib>
#include <iostream>

namespace vc {

// Diagnostic tracing to std::cerr, switched on by setting VC_VALIDATE_DEBUG
// in the environment. The variable is read once per process.
inline bool debug_enabled() {
    static const bool enabled = std::getenv("VC_VALIDATE_DEBUG") != nullptr;
    return enabled;
}

}  // namespace vc
