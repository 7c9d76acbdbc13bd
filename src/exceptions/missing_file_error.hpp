// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef missing_file_error_hpp
#define missing_file_error_hpp

#include <string>

#include <boost/filesystem/path.hpp>

#include "user_error.hpp"

namespace heredity {

// The user named a file that does not exist. Subclasses say where the file was needed.
class MissingFileError : public UserError
{
public:
    using Path = boost::filesystem::path;
    
    MissingFileError() = delete;
    
    // description says what the file was for, e.g. "family"
    MissingFileError(Path file, std::string description);
    
    const Path& file() const noexcept;
    
private:
    std::string do_why() const override;
    std::string do_help() const override;
    
    Path file_;
    std::string description_;
};

} // namespace heredity

#endif
