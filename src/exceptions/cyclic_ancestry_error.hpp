// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef cyclic_ancestry_error_hpp
#define cyclic_ancestry_error_hpp

#include <string>

#include "user_error.hpp"

namespace heredity {

/**
 A CyclicAncestryError is thrown when the parent relationships of a family make some member
 their own ancestor.
 */
class CyclicAncestryError : public UserError
{
public:
    CyclicAncestryError() = delete;
    
    CyclicAncestryError(std::string person);
    
    virtual ~CyclicAncestryError() override = default;
    
    const std::string& person() const noexcept;
    
private:
    virtual std::string do_where() const override;
    virtual std::string do_why() const override;
    virtual std::string do_help() const override;
    
    std::string person_;
};

} // namespace heredity

#endif
