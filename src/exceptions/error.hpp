// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef error_hpp
#define error_hpp

#include <exception>
#include <string>

namespace heredity {

/**
 Error is the base of every exception heredity reports to the user. An error states who caused
 it (type), the component that raised it (where), what went wrong (why), and what the user can
 do about it (help). Messages are lower case fragments; the error handler turns them into
 sentences.
 */
class Error : public std::exception
{
public:
    virtual ~Error() override = default;
    
    std::string type() const { return do_type(); }
    std::string where() const { return do_where(); }
    std::string why() const { return do_why(); }
    std::string help() const { return do_help(); }
    
    // "<type> error in <where>: <why>"
    const char* what() const noexcept override;
    
private:
    virtual std::string do_type() const  = 0;
    virtual std::string do_where() const = 0;
    virtual std::string do_why() const   = 0;
    virtual std::string do_help() const  = 0;
    
    mutable std::string message_;
};

} // namespace heredity

#endif
