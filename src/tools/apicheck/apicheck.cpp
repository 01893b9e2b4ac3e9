//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Entry point of the `apicheck` binary. All work happens in runCLI so tests
// can drive the tool with string streams.
//
//===----------------------------------------------------------------------===//

#include "tools/apicheck/cli.hpp"

#include <iostream>

int main(int argc, char **argv)
{
    return apicheck::tools::runCLI(argc, argv, std::cout, std::cerr);
}
