// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef impossible_evidence_error_hpp
#define impossible_evidence_error_hpp

#include <string>

#include "user_error.hpp"

namespace heredity {

/**
 An ImpossibleEvidenceError is thrown when no hypothesis consistent with the observed traits has
 positive probability for some family member, so their distribution cannot be normalised.
 
 This cannot happen with strictly positive probability tables.
 */
class ImpossibleEvidenceError : public UserError
{
public:
    ImpossibleEvidenceError() = delete;
    
    ImpossibleEvidenceError(std::string person);
    
    virtual ~ImpossibleEvidenceError() override = default;
    
    const std::string& person() const noexcept;
    
private:
    virtual std::string do_where() const override;
    virtual std::string do_why() const override;
    virtual std::string do_help() const override;
    
    std::string person_;
};

} // namespace heredity

#endif
