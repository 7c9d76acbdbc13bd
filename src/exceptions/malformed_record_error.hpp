// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef malformed_record_error_hpp
#define malformed_record_error_hpp

#include <string>

#include <boost/optional.hpp>

#include "user_error.hpp"

namespace heredity {

/**
 A MalformedRecordError is thrown when a family record cannot be placed in a family, e.g. because
 it names a parent that is not in the family.
 */
class MalformedRecordError : public UserError
{
public:
    enum class Reason { unknown_parent, single_parent, duplicate_name, empty_name };
    
    MalformedRecordError() = delete;
    
    MalformedRecordError(std::string person, Reason reason);
    
    MalformedRecordError(std::string person, Reason reason, std::string other);
    
    virtual ~MalformedRecordError() override = default;
    
    const std::string& person() const noexcept;
    Reason reason() const noexcept;
    
private:
    virtual std::string do_where() const override;
    virtual std::string do_why() const override;
    virtual std::string do_help() const override;
    
    std::string person_;
    Reason reason_;
    boost::optional<std::string> other_;
};

} // namespace heredity

#endif
