// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "common.hpp"

namespace heredity {

bool DEBUG_MODE {false};
bool TRACE_MODE {false};

namespace logging {

namespace {

template <typename Log>
boost::optional<Log> make_log_if(const bool enabled)
{
    if (!enabled) return boost::none;
    return Log {};
}

} // namespace

boost::optional<DebugLogger> get_debug_log()
{
    return make_log_if<DebugLogger>(DEBUG_MODE);
}

boost::optional<TraceLogger> get_trace_log()
{
    return make_log_if<TraceLogger>(TRACE_MODE);
}

} // namespace logging
} // namespace heredity
