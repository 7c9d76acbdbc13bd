// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef option_collation_hpp
#define option_collation_hpp

#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>

#include "option_parser.hpp"
#include "core/models/probability_tables.hpp"
#include "core/heredity.hpp"

namespace heredity { namespace options {

// False if parse_options only printed help or version information
bool is_run_command(const OptionMap& options);

boost::optional<boost::filesystem::path> get_debug_log_file_name(const OptionMap& options);
boost::optional<boost::filesystem::path> get_trace_log_file_name(const OptionMap& options);

boost::filesystem::path get_family_file(const OptionMap& options);
boost::optional<boost::filesystem::path> get_output_file(const OptionMap& options);
unsigned get_output_precision(const OptionMap& options);

// Throws InvalidProbabilityTables if the gene prior does not sum to one
ProbabilityTables make_probability_tables(const OptionMap& options);

InferenceOptions make_inference_options(const OptionMap& options);

} // namespace options
} // namespace heredity

#endif
