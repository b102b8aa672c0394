// Central options validation for the pipeline, fusion and session entry points
#pragma once

#include <string>
#include "pulsefuse_core.h"

// Returns false if options are invalid. On failure, sets err_code (stable code)
// and err_msg (short reason). On success, err_code/msg are untouched.
// Validation only: nothing is clamped or mutated.
extern "C" bool pf_validate_options(double sampleRate,
                                    const pulsefuse::Options& opt,
                                    const char** err_code,
                                    std::string* err_msg);
