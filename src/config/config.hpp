// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef config_hpp
#define config_hpp

#include <string>
#include <iosfwd>

namespace heredity { namespace config {

// Filled in by CMake through version.hpp
struct BuildInfo
{
    unsigned major_version, minor_version, patch_version;
    std::string release_name; // empty for unnamed releases
    std::string system_name;
    std::string compiler;
    std::string boost_version;
    std::string build_type;
};

extern const BuildInfo Build;

// major.minor.patch, with the release name appended if there is one
std::string version_string();

std::ostream& print_build_info(std::ostream& os);

extern const std::string BugReport;

extern const std::string LicenseNotice;

// Width that error messages are wrapped to
extern const unsigned CommandLineWidth;

} // namespace config
} // namespace heredity

#endif
