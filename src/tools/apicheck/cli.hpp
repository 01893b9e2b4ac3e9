//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/apicheck/cli.hpp
// Purpose: Command-line parsing for the apicheck tool.
// Key invariants: Parsing never touches the filesystem; input files are only
//                 classified by extension.
// Ownership/Lifetime: Returns owned option values.
// Links: tools/apicheck/apicheck.cpp

#pragma once

#include "check/ApiChecker.hpp"
#include "check/CheckOptions.hpp"
#include "support/diag_expected.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace apicheck::tools
{

/// @brief Everything the apicheck command line specifies.
struct CliOptions
{
    std::string catalogPath;
    check::CheckOptions check{};
    std::vector<check::CompiledUnit> units;
    std::vector<check::ResourceFile> resources;
    bool showHelp = false;
};

/// @brief Parse @p argv (program name at index 0).
/// @return Options, or a DiagCode::Usage diagnostic.
support::Expected<CliOptions> parseCommandLine(int argc, char **argv);

/// @brief Print the synopsis to @p os.
void printUsage(std::ostream &os);

/// @brief Run the tool with injectable streams.
/// @return 0 without violations, 1 with violations, 2 on usage or catalog errors.
int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err);

} // namespace apicheck::tools
