//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/check/CheckOptions.hpp
// Purpose: Run-wide settings of one compatibility check.
// Key invariants: None; fields are independent.
// Ownership/Lifetime: Value type, filled by the CLI or by embedding hosts.
// Links: check/ApiChecker.hpp, tools/apicheck/cli.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <string>

namespace apicheck::check
{

/// @brief Settings that do not come from the inputs themselves.
struct CheckOptions
{
    /// @brief Declared minimum platform version of the project.
    int minVersion = 1;

    /// @brief Worker threads for scanning; 0 selects the hardware concurrency.
    size_t jobs = 0;

    /// @brief Directory that reported file paths are made relative to.
    std::string baseDir;

    /// @brief Emit progress lines on the trace channel.
    bool trace = false;
};

} // namespace apicheck::check
