// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef main_logging_hpp
#define main_logging_hpp

#include "core/models/probability_tables.hpp"
#include "core/heredity.hpp"

namespace heredity {

void log_program_startup();

void log_program_end(bool succeeded);

// Debug only
void log_run_settings(const ProbabilityTables& tables, const InferenceOptions& options);

} // namespace heredity

#endif
