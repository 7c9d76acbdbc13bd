// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "string_utils.hpp"

#include <cctype>

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/classification.hpp>

namespace heredity { namespace utils {

std::string join(const std::vector<std::string>& strings, const std::string& delim)
{
    return boost::algorithm::join(strings, delim);
}

std::string& trim(std::string& str)
{
    boost::algorithm::trim(str);
    return str;
}

std::string capitalise_front(std::string str)
{
    if (!str.empty()) {
        str.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(str.front())));
    }
    return str;
}

std::vector<std::string> wrap(const std::string& text, const std::size_t width)
{
    std::vector<std::string> words {};
    boost::algorithm::split(words, boost::algorithm::trim_copy(text), boost::algorithm::is_space(),
                            boost::algorithm::token_compress_on);
    std::vector<std::string> result {};
    std::string line {};
    for (const auto& word : words) {
        if (word.empty()) continue;
        if (!line.empty() && line.size() + 1 + word.size() > width) {
            result.push_back(line);
            line.clear();
        }
        if (!line.empty()) line += ' ';
        line += word;
    }
    if (!line.empty()) result.push_back(line);
    return result;
}

} // namespace utils
} // namespace heredity
