// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <iostream>
#include <fstream>
#include <cstdlib>
#include <chrono>
#include <exception>
#include <string>
#include <vector>
#include <new>
#include <utility>

#include <boost/filesystem/path.hpp>

#include "config/common.hpp"
#include "config/option_parser.hpp"
#include "config/option_collation.hpp"
#include "core/heredity.hpp"
#include "io/family/family_reader.hpp"
#include "io/family/distribution_writer.hpp"
#include "logging/logging.hpp"
#include "logging/main_logging.hpp"
#include "logging/error_handler.hpp"
#include "exceptions/error.hpp"
#include "exceptions/system_error.hpp"
#include "utils/timing.hpp"
#include "utils/string_utils.hpp"

using namespace heredity;

namespace {

class UnwritableOutputFile : public SystemError
{
public:
    UnwritableOutputFile(boost::filesystem::path file) : file_ {std::move(file)} {}

private:
    std::string do_where() const override { return "write_output"; }
    std::string do_why() const override { return "could not open " + file_.string() + " for writing"; }
    std::string do_help() const override { return "check the output directory exists and you have write permission"; }

    boost::filesystem::path file_;
};

template <typename E>
int fail(const E& error)
{
    log_error(error);
    log_program_end(false);
    return EXIT_FAILURE;
}

void init_logging(const options::OptionMap& options)
{
    const auto debug_log = options::get_debug_log_file_name(options);
    const auto trace_log = options::get_trace_log_file_name(options);
    DEBUG_MODE = static_cast<bool>(debug_log) || static_cast<bool>(trace_log);
    TRACE_MODE = static_cast<bool>(trace_log);
    logging::init(debug_log, trace_log);
}

std::string command_line(const int argc, const char** argv)
{
    return utils::join(std::vector<std::string>(argv, argv + argc), " ");
}

void write_output(const options::OptionMap& options, const Family& family, const FamilyDistribution& distribution)
{
    const auto precision = options::get_output_precision(options);
    const auto output_file = options::get_output_file(options);
    if (!output_file) {
        io::write_distributions(std::cout, family, distribution, precision);
        return;
    }
    std::ofstream output {output_file->string()};
    if (!output) throw UnwritableOutputFile {*output_file};
    io::write_distributions(output, family, distribution, precision);
    logging::InfoLogger info_log {};
    stream(info_log) << "Wrote distributions to " << output_file->string();
}

void run_heredity(const options::OptionMap& options)
{
    logging::InfoLogger info_log {};
    const auto family_file = options::get_family_file(options);
    stream(info_log) << "Reading family from " << family_file.string();
    const auto family = io::read_family(family_file);
    const auto tables = options::make_probability_tables(options);
    const auto inference_options = options::make_inference_options(options);
    log_run_settings(tables, inference_options);
    write_output(options, family, infer(family, tables, inference_options));
}

} // namespace

int main(const int argc, const char** argv)
{
    options::OptionMap options {};
    try {
        options = options::parse_options(argc, argv);
    } catch (const Error& e) {
        logging::init();
        return fail(e);
    } catch (const std::exception& e) {
        logging::init();
        return fail(e);
    }
    if (!options::is_run_command(options)) return EXIT_SUCCESS;
    try {
        init_logging(options);
        log_program_startup();
        logging::InfoLogger info_log {};
        stream(info_log) << "Invoked as: " << command_line(argc, argv);
        utils::TimeInterval run_time {std::chrono::steady_clock::now(), {}};
        run_heredity(options);
        run_time.end = std::chrono::steady_clock::now();
        stream(info_log) << "Finished in " << run_time;
        log_program_end(true);
    } catch (const Error& e) {
        return fail(e);
    } catch (const std::bad_alloc& e) {
        return fail(e);
    } catch (const std::exception& e) {
        return fail(e);
    } catch (...) {
        log_unknown_error();
        log_program_end(false);
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
