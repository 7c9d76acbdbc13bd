// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef family_too_large_error_hpp
#define family_too_large_error_hpp

#include <string>
#include <cstddef>

#include "user_error.hpp"

namespace heredity {

/**
 A FamilyTooLargeError is thrown when a family has more hypotheses than can be counted, so
 exact enumeration is impossible.
 */
class FamilyTooLargeError : public UserError
{
public:
    FamilyTooLargeError() = delete;
    
    FamilyTooLargeError(std::size_t num_members, std::size_t num_unobserved);
    
    virtual ~FamilyTooLargeError() override = default;
    
private:
    virtual std::string do_where() const override;
    virtual std::string do_why() const override;
    virtual std::string do_help() const override;
    
    std::size_t num_members_, num_unobserved_;
};

} // namespace heredity

#endif
