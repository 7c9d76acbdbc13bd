// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "missing_file_error.hpp"

#include <utility>

namespace heredity {

MissingFileError::MissingFileError(Path file, std::string description)
: file_ {std::move(file)}
, description_ {std::move(description)}
{}

const MissingFileError::Path& MissingFileError::file() const noexcept
{
    return file_;
}

std::string MissingFileError::do_why() const
{
    return "there is no " + description_ + " file at " + file_.string();
}

std::string MissingFileError::do_help() const
{
    return "check the path, remembering that relative paths are resolved from the working directory";
}

} // namespace heredity
