// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "logging.hpp"

#include <array>
#include <iostream>
#include <cstddef>

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

namespace heredity { namespace logging {

namespace blog     = boost::log;
namespace keywords = boost::log::keywords;
namespace expr     = boost::log::expressions;

std::ostream& operator<<(std::ostream& os, const severity_level level)
{
    static const std::array<const char*, 4> labels {{"TRCE", "DEBG", "INFO", "EROR"}};
    return os << labels[static_cast<std::size_t>(level)];
}

namespace {

auto record_format()
{
    return expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "[%Y-%m-%d %H:%M:%S]")
        << " <" << severity << "> " << expr::smessage;
}

void add_file_sink(const boost::filesystem::path& file, const severity_level min_level)
{
    blog::add_file_log(keywords::file_name = file.string(),
                       keywords::filter = severity >= min_level,
                       keywords::format = record_format(),
                       keywords::auto_flush = true);
}

} // namespace

void init(boost::optional<boost::filesystem::path> debug_log,
          boost::optional<boost::filesystem::path> trace_log)
{
    const auto core = blog::core::get();
    core->remove_all_sinks();
    blog::add_console_log(std::clog,
                          keywords::filter = severity >= severity_level::info,
                          keywords::format = record_format());
    if (debug_log) add_file_sink(*debug_log, severity_level::debug);
    if (trace_log) add_file_sink(*trace_log, severity_level::trace);
    blog::add_common_attributes();
}

} // namespace logging
} // namespace heredity
