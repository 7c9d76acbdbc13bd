// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "malformed_record_error.hpp"

#include <utility>
#include <sstream>

namespace heredity {

MalformedRecordError::MalformedRecordError(std::string person, Reason reason)
: person_ {std::move(person)}
, reason_ {reason}
{}

MalformedRecordError::MalformedRecordError(std::string person, Reason reason, std::string other)
: person_ {std::move(person)}
, reason_ {reason}
, other_ {std::move(other)}
{}

const std::string& MalformedRecordError::person() const noexcept
{
    return person_;
}

MalformedRecordError::Reason MalformedRecordError::reason() const noexcept
{
    return reason_;
}

std::string MalformedRecordError::do_where() const
{
    return "make_family";
}

std::string MalformedRecordError::do_why() const
{
    std::ostringstream ss {};
    switch (reason_) {
        case Reason::unknown_parent:
            ss << "the record for '" << person_ << "' names parent '" << (other_ ? *other_ : "")
               << "' who is not a member of the family";
            break;
        case Reason::single_parent:
            ss << "the record for '" << person_ << "' specifies only one parent";
            break;
        case Reason::duplicate_name:
            ss << "there is more than one record for '" << person_ << "'";
            break;
        case Reason::empty_name:
            ss << "a record has no name";
            break;
    }
    return ss.str();
}

std::string MalformedRecordError::do_help() const
{
    switch (reason_) {
        case Reason::unknown_parent:
            return "add a record for every parent, or leave both parents blank";
        case Reason::single_parent:
            return "specify both the mother and the father, or neither";
        case Reason::duplicate_name:
        case Reason::empty_name:
        default:
            return "ensure every family member has a unique non-empty name";
    }
}

} // namespace heredity
