// version.hpp (Shared Version Information)
// Program title and build version. The version string may be injected by the
// build system so that snapshots and logs report the exact build that wrote
// them.

#pragma once

#include <string_view>

namespace wager::version {

inline constexpr std::string_view kProgramTitle{"wager-core"};

namespace detail {

#if defined(WAGER_VERSION_STRING)
inline constexpr std::string_view kVersionSource{WAGER_VERSION_STRING};
#else
// Fallback used when the build system has not injected a version.
inline constexpr std::string_view kVersionSource{"0.1.0 dev"};
#endif

}  // namespace detail

inline constexpr std::string_view kProgramVersion = detail::kVersionSource;

}  // namespace wager::version
