// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef common_hpp
#define common_hpp

#include <string>

#include <boost/optional.hpp>

#include "logging/logging.hpp"

namespace heredity {

// Set once from the command line before any inference starts
extern bool DEBUG_MODE;
extern bool TRACE_MODE;

using PersonName = std::string;

enum class ExecutionPolicy { seq, par };

namespace logging {

// Empty unless the corresponding mode is on
boost::optional<DebugLogger> get_debug_log();
boost::optional<TraceLogger> get_trace_log();

} // namespace logging
} // namespace heredity

#endif
