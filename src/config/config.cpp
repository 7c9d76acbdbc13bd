// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "config.hpp"

#include <ostream>

#include "version.hpp"

namespace heredity { namespace config {

const BuildInfo Build {
    VERSION_MAJOR, VERSION_MINOR, VERSION_PATCH, VERSION_RELEASE,
    SYSTEM_NAME,
    std::string {COMPILER_NAME} + ' ' + COMPILER_VERSION,
    BOOSTLIB_VERSION,
    BUILD_TYPE
};

std::string version_string()
{
    auto result = std::to_string(Build.major_version) + '.' + std::to_string(Build.minor_version)
                  + '.' + std::to_string(Build.patch_version);
    if (!Build.release_name.empty()) result += '-' + Build.release_name;
    return result;
}

std::ostream& print_build_info(std::ostream& os)
{
    return os << "heredity " << version_string() << '\n'
              << "  system:     " << Build.system_name << '\n'
              << "  compiler:   " << Build.compiler << '\n'
              << "  boost:      " << Build.boost_version << '\n'
              << "  build type: " << Build.build_type << '\n';
}

const std::string BugReport {"the heredity maintainers"};

const std::string LicenseNotice {"heredity is free software distributed under the MIT license"};

const unsigned CommandLineWidth {72};

} // namespace config
} // namespace heredity
