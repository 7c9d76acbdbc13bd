// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef string_utils_hpp
#define string_utils_hpp

#include <vector>
#include <string>
#include <cstddef>
#include <type_traits>
#include <sstream>
#include <iomanip>

namespace heredity { namespace utils {

std::string join(const std::vector<std::string>& strings, const std::string& delim);

std::string& trim(std::string& str);

std::string capitalise_front(std::string str);

// Breaks text into lines of at most width characters at whitespace. A word longer than width
// gets a line to itself.
std::vector<std::string> wrap(const std::string& text, std::size_t width);

template <typename T, typename = typename std::enable_if_t<std::is_floating_point<T>::value>>
std::string to_string(const T val, const unsigned precision = 2)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << val;
    return out.str();
}

} // namespace utils
} // namespace heredity

#endif
