#ifndef MESHNODE_VERSION_HPP
#define MESHNODE_VERSION_HPP

#pragma once

namespace meshnode {

    /// Project semantic version components
    inline constexpr int version_major = 0;
    inline constexpr int version_minor = 3;
    inline constexpr int version_patch = 0;

    /// Combined version string (e.g. "0.3.0")
    inline constexpr const char* version_string = "0.3.0";

#ifndef MESHNODE_GIT_COMMIT
#define MESHNODE_GIT_COMMIT "unknown"
#endif
#ifndef MESHNODE_BUILD_DATE
#define MESHNODE_BUILD_DATE "unknown"
#endif

    /// Commit hash injected by the build system
    inline constexpr const char* git_commit = MESHNODE_GIT_COMMIT;
    /// Build date injected by the build system
    inline constexpr const char* build_date = MESHNODE_BUILD_DATE;

} // namespace meshnode

#endif // MESHNODE_VERSION_HPP
