#pragma once

#ifndef HARBOR_VERSION_STRING
#define HARBOR_VERSION_STRING "0.0.0"
#endif

#ifndef GIT_COMMIT_HASH
#define GIT_COMMIT_HASH "unknown"
#endif

namespace harbor {

inline constexpr const char* VERSION = HARBOR_VERSION_STRING;

}  // namespace harbor
