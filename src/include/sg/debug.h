#pragma once

#include <cstdlib>

namespace sg {

// Tracing to stderr is enabled by setting SG_VALIDATE_DEBUG in the environment.
inline bool debugEnabled() { return std::getenv("SG_VALIDATE_DEBUG") != nullptr; }

}  // namespace sg
