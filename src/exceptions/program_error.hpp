// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef program_error_hpp
#define program_error_hpp

#include <string>

#include "error.hpp"
#include "config/config.hpp"

namespace heredity {

/**
 A ProgramError means heredity broke one of its own invariants. It is always a bug, so the help
 asks for a report.
 */
class ProgramError : public Error
{
    std::string do_type() const override { return "program"; }
    std::string do_help() const override
    {
        return "rerun with --debug and send the command line, family file and log to " + config::BugReport;
    }
};

} // namespace heredity

#endif
