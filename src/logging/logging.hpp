// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef logging_hpp
#define logging_hpp

#ifndef BOOST_LOG_DYN_LINK
#define BOOST_LOG_DYN_LINK 1
#endif

#include <iosfwd>
#include <sstream>
#include <string>
#include <utility>

#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions/keyword.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/global_logger_storage.hpp>

namespace heredity { namespace logging {

enum class severity_level { trace, debug, info, error };

std::ostream& operator<<(std::ostream& os, severity_level level);

using SeverityLogger = boost::log::sources::severity_logger_mt<severity_level>;

BOOST_LOG_INLINE_GLOBAL_LOGGER_DEFAULT(global_logger, SeverityLogger)

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

// Info and error messages go to std::clog. The optional files additionally receive debug,
// or debug and trace, messages.
void init(boost::optional<boost::filesystem::path> debug_log = boost::none,
          boost::optional<boost::filesystem::path> trace_log = boost::none);

template <severity_level Level>
class Logger
{
public:
    Logger() : logger_ {&global_logger::get()} {}

    void write(const std::string& message) { BOOST_LOG_SEV(*logger_, Level) << message; }

private:
    SeverityLogger* logger_;
};

template <severity_level Level>
Logger<Level>& operator<<(Logger<Level>& log, const std::string& message)
{
    log.write(message);
    return log;
}

using TraceLogger = Logger<severity_level::trace>;
using DebugLogger = Logger<severity_level::debug>;
using InfoLogger  = Logger<severity_level::info>;
using ErrorLogger = Logger<severity_level::error>;

/**
 A LogRecord collects everything streamed into it and writes it to the log as a single
 message when it goes out of scope.
 */
template <typename Log>
class LogRecord
{
public:
    explicit LogRecord(Log& log) : log_ {&log}, message_ {} {}

    LogRecord(const LogRecord&)            = delete;
    LogRecord& operator=(const LogRecord&) = delete;
    LogRecord(LogRecord&& other) : log_ {other.log_}, message_ {std::move(other.message_)}
    {
        other.log_ = nullptr;
    }
    LogRecord& operator=(LogRecord&&) = delete;

    ~LogRecord()
    {
        if (log_) log_->write(message_.str());
    }

    template <typename T>
    LogRecord& operator<<(const T& value)
    {
        message_ << value;
        return *this;
    }

private:
    Log* log_;
    std::ostringstream message_;
};

template <typename Log>
LogRecord<Log> stream(Log& log)
{
    return LogRecord<Log> {log};
}

} // namespace logging
} // namespace heredity

#endif
