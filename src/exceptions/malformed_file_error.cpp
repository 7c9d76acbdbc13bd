// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "malformed_file_error.hpp"

#include <utility>
#include <sstream>

namespace heredity {

MalformedFileError::MalformedFileError(Path file, std::string format)
: file_ {std::move(file)}
, format_ {std::move(format)}
{}

void MalformedFileError::set_reason(std::string reason)
{
    reason_ = std::move(reason);
}

void MalformedFileError::set_line_number(const std::size_t line_number) noexcept
{
    line_number_ = line_number;
}

const MalformedFileError::Path& MalformedFileError::file() const noexcept
{
    return file_;
}

std::string MalformedFileError::do_why() const
{
    std::ostringstream ss {};
    ss << file_.string() << " is not a valid " << format_ << " file";
    if (line_number_) ss << " (line " << *line_number_ << ')';
    if (reason_) ss << ": " << *reason_;
    return ss.str();
}

std::string MalformedFileError::do_help() const
{
    return "check that " + file_.filename().string() + " is a " + format_ + " file";
}

} // namespace heredity
