// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef malformed_file_error_hpp
#define malformed_file_error_hpp

#include <string>
#include <cstddef>

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include "user_error.hpp"

namespace heredity {

/**
 A MalformedFileError is raised when a file the user gave exists but cannot be parsed as the
 expected format. The reason and line number, when known, are included in why().
 */
class MalformedFileError : public UserError
{
public:
    using Path = boost::filesystem::path;
    
    MalformedFileError() = delete;
    
    MalformedFileError(Path file, std::string format);
    
    void set_reason(std::string reason);
    void set_line_number(std::size_t line_number) noexcept;
    
    const Path& file() const noexcept;
    
private:
    std::string do_why() const override;
    std::string do_help() const override;
    
    Path file_;
    std::string format_;
    boost::optional<std::string> reason_;
    boost::optional<std::size_t> line_number_;
};

} // namespace heredity

#endif
