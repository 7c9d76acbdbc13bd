// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef error_handler_hpp
#define error_handler_hpp

#include <exception>
#include <new>
#include <string>
#include <vector>
#include <cstddef>

#include "exceptions/error.hpp"

namespace heredity {

// The lines log_error writes for an error, each at most line_width characters where possible
std::vector<std::string> make_error_report(const Error& error, std::size_t line_width);

void log_error(const Error& error);
void log_error(const std::bad_alloc&);
void log_error(const std::exception& error);
void log_unknown_error();

} // namespace heredity

#endif
