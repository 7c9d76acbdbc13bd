// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "error_handler.hpp"

#include <utility>
#include <iterator>

#include "exceptions/system_error.hpp"
#include "config/config.hpp"
#include "utils/string_utils.hpp"
#include "logging.hpp"

namespace heredity {

namespace {

const std::string why_indent {"    "};
const std::string help_label {"Help: "};

std::string as_sentence(std::string fragment)
{
    fragment = utils::capitalise_front(std::move(fragment));
    if (!fragment.empty() && fragment.back() != '.') fragment += '.';
    return fragment;
}

void append_wrapped(const std::string& text, const std::string& indent, const std::size_t line_width,
                    std::vector<std::string>& lines)
{
    const auto width = line_width > indent.size() ? line_width - indent.size() : 1;
    for (const auto& line : utils::wrap(text, width)) {
        lines.push_back(indent + line);
    }
}

} // namespace

std::vector<std::string> make_error_report(const Error& error, const std::size_t line_width)
{
    std::vector<std::string> result {};
    result.push_back("heredity stopped (" + error.type() + " error in " + error.where() + "):");
    append_wrapped(as_sentence(error.why()), why_indent, line_width, result);
    const auto help = utils::wrap(help_label + as_sentence(error.help()), line_width);
    result.insert(std::end(result), std::begin(help), std::end(help));
    return result;
}

void log_error(const Error& error)
{
    logging::ErrorLogger log {};
    for (const auto& line : make_error_report(error, config::CommandLineWidth)) {
        log << line;
    }
}

namespace {

class OutOfMemory : public SystemError
{
    std::string do_where() const override { return "heredity"; }
    std::string do_why() const override { return "heredity ran out of memory"; }
    std::string do_help() const override
    {
        return "free some memory, or use fewer threads so fewer partial distributions are held at once";
    }
};

class UnexpectedException : public Error
{
public:
    UnexpectedException(std::string what) : what_ {std::move(what)} {}
    
private:
    std::string do_type() const override { return "unclassified"; }
    std::string do_where() const override { return "heredity"; }
    std::string do_why() const override { return "an unexpected exception was thrown (" + what_ + ")"; }
    std::string do_help() const override
    {
        return "this is a bug, please report it with the command line and family file to " + config::BugReport;
    }
    
    std::string what_;
};

} // namespace

void log_error(const std::bad_alloc&)
{
    log_error(OutOfMemory {});
}

void log_error(const std::exception& error)
{
    log_error(UnexpectedException {error.what()});
}

void log_unknown_error()
{
    log_error(UnexpectedException {"not derived from std::exception"});
}

} // namespace heredity
