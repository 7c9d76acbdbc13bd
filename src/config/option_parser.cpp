// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "option_parser.hpp"

#include <vector>
#include <iostream>
#include <sstream>
#include <fstream>
#include <utility>
#include <cstddef>

#include <boost/filesystem/path.hpp>
#include <boost/filesystem/operations.hpp>

#include "config.hpp"

namespace po = boost::program_options;
namespace fs = boost::filesystem;

namespace heredity { namespace options {

CommandLineError::CommandLineError(std::string why) : why_ {std::move(why)} {}

std::string CommandLineError::do_where() const
{
    return "parse_options";
}

std::string CommandLineError::do_why() const
{
    return why_;
}

std::string CommandLineError::do_help() const
{
    return "run heredity --help to see every option and the values it accepts";
}

namespace {

const std::vector<double> default_gene_prior {0.96, 0.03, 0.01};
const std::vector<double> default_trait_penetrance {0.01, 0.56, 0.65};

po::options_description make_general_options()
{
    po::options_description result {"General"};
    result.add_options()
    ("help,h", "Print this help message and exit")
    ("version", "Print version and build information and exit")
    ("config", po::value<fs::path>(),
     "File of option=value lines read after the command line")
    ("debug", po::value<fs::path>()->implicit_value("heredity_debug.log"),
     "Write debug messages to this file")
    ("trace", po::value<fs::path>()->implicit_value("heredity_trace.log"),
     "Write debug and per-member trace messages to this file")
    ("threads,t", po::value<int>()->default_value(1),
     "Number of threads that evaluate hypotheses, 0 for one per hardware thread");
    return result;
}

po::options_description make_io_options()
{
    po::options_description result {"Input and output"};
    result.add_options()
    ("family,f", po::value<fs::path>()->required(),
     "CSV family file with a name, mother, father, trait header")
    ("output,o", po::value<fs::path>(),
     "Write the distributions here instead of standard output")
    ("precision", po::value<int>()->default_value(4),
     "Decimal places printed for each probability");
    return result;
}

po::options_description make_model_options()
{
    po::options_description result {"Model"};
    result.add_options()
    ("mutation-rate", po::value<double>()->default_value(0.01),
     "Probability that a gene copy flips as it passes from parent to child")
    ("gene-prior", po::value<std::vector<double>>()->multitoken()->default_value(default_gene_prior, "0.96 0.03 0.01"),
     "P(0, 1 and 2 gene copies) for members without recorded parents")
    ("trait-penetrance", po::value<std::vector<double>>()->multitoken()->default_value(default_trait_penetrance, "0.01 0.56 0.65"),
     "P(trait) for members with 0, 1 and 2 gene copies");
    return result;
}

class UnknownOption : public CommandLineError
{
public:
    UnknownOption(const std::string& option)
    : CommandLineError {"heredity has no option '" + option + "'"} {}
};

class MissingOption : public CommandLineError
{
public:
    MissingOption(const std::string& option)
    : CommandLineError {"the option --" + option + " must be given"} {}
};

class MissingConfigFile : public CommandLineError
{
public:
    MissingConfigFile(const fs::path& file)
    : CommandLineError {"the config file " + file.string() + " given to --config does not exist"} {}
};

class InvalidOptionValue : public CommandLineError
{
public:
    template <typename T>
    InvalidOptionValue(const std::string& option, const T& value, const std::string& requirement)
    : CommandLineError {describe(option, value, requirement)} {}
    
private:
    template <typename T>
    static std::string describe(const std::string& option, const T& value, const std::string& requirement)
    {
        std::ostringstream ss {};
        ss << "the option --" << option << " was given " << value << " but " << requirement;
        return ss.str();
    }
};

class WrongNumberOfValues : public CommandLineError
{
public:
    WrongNumberOfValues(const std::string& option, const std::size_t required, const std::size_t given)
    : CommandLineError {"the option --" + option + " needs " + std::to_string(required) + " values but "
                        + std::to_string(given) + " were given"} {}
};

// Rethrows program_options errors as CommandLineErrors
template <typename Action>
void translating_errors(Action action)
{
    try {
        action();
    } catch (const po::required_option& e) {
        throw MissingOption {po::strip_prefixes(e.get_option_name())};
    } catch (const po::unknown_option& e) {
        throw UnknownOption {e.get_option_name()};
    } catch (const po::error& e) {
        throw CommandLineError {e.what()};
    }
}

void store_config_file(const fs::path& file, const po::options_description& options, OptionMap& vm)
{
    if (!fs::exists(file)) {
        throw MissingConfigFile {file};
    }
    std::ifstream config {file.string()};
    translating_errors([&] () { po::store(po::parse_config_file(config, options), vm); });
}

void check_non_negative(const std::string& option, const OptionMap& vm)
{
    const auto value = vm.at(option).as<int>();
    if (value < 0) {
        throw InvalidOptionValue {option, value, "must not be negative"};
    }
}

bool is_probability(const double value) noexcept
{
    return value >= 0 && value <= 1;
}

void check_probability(const std::string& option, const double value)
{
    if (!is_probability(value)) {
        throw InvalidOptionValue {option, value, "must be between 0 and 1"};
    }
}

// program_options cannot bound the number of multitoken values
void check_three_probabilities(const std::string& option, const OptionMap& vm)
{
    const auto& values = vm.at(option).as<std::vector<double>>();
    if (values.size() != 3) {
        throw WrongNumberOfValues {option, 3, values.size()};
    }
    for (const auto value : values) {
        check_probability(option, value);
    }
}

void validate(const OptionMap& vm)
{
    if (vm.count("family") == 0) {
        throw MissingOption {"family"};
    }
    check_non_negative("threads", vm);
    check_non_negative("precision", vm);
    check_probability("mutation-rate", vm.at("mutation-rate").as<double>());
    check_three_probabilities("gene-prior", vm);
    check_three_probabilities("trait-penetrance", vm);
}

} // namespace

OptionMap parse_options(const int argc, const char** argv)
{
    po::options_description all {"heredity options"};
    all.add(make_general_options()).add(make_io_options()).add(make_model_options());
    po::positional_options_description positional {};
    positional.add("family", 1);
    
    OptionMap result {};
    translating_errors([&] () {
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), result);
    });
    
    if (result.count("help") == 1) {
        std::cout << "Usage: heredity [options] family.csv\n\n" << all << std::endl;
        return result;
    }
    if (result.count("version") == 1) {
        config::print_build_info(std::cout) << std::flush;
        return result;
    }
    if (result.count("config") == 1) {
        store_config_file(result.at("config").as<fs::path>(), all, result);
    }
    validate(result);
    translating_errors([&] () { po::notify(result); });
    return result;
}

} // namespace options
} // namespace heredity
