// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef option_parser_hpp
#define option_parser_hpp

#include <string>

#include <boost/program_options.hpp>

#include "exceptions/user_error.hpp"

namespace heredity { namespace options {

using OptionMap = boost::program_options::variables_map;

/**
 Parses and validates the command line, then any --config file. Values given on the command line
 take precedence over the config file, which takes precedence over the defaults.
 
 If --help or --version is given the information is printed to standard output and the returned
 map is not validated.
 */
OptionMap parse_options(int argc, const char** argv);

// Base of every error raised while reading options
class CommandLineError : public UserError
{
public:
    explicit CommandLineError(std::string why);
    
private:
    std::string do_where() const override;
    std::string do_why() const override;
    std::string do_help() const override;
    
    std::string why_;
};

} // namespace options
} // namespace heredity

#endif
