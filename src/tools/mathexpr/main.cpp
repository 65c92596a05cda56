//===----------------------------------------------------------------------===//
//
// Part of the MathExpr project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the top-level `mathexpr` driver.  Option decoding and the
// parse/render pipeline live in cli.cpp; this file binds them to the process
// streams and exit status.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point for the `mathexpr` command-line tool.

#include "cli.hpp"

#include <iostream>
#include <string>

/// @brief Program entry for `mathexpr`.
/// @return 0 on success, 1 on a parse error, 2 on a usage error.
int main(int argc, char **argv)
{
    using namespace mathexpr::tools;

    CliOptions opts;
    std::string error;
    switch (parseCommandLine(ArgvView{argc, argv}.drop_front(), opts, error))
    {
        case CliParseResult::Help:
            usage(std::cout);
            return kExitOk;
        case CliParseResult::Version:
            printVersion(std::cout);
            return kExitOk;
        case CliParseResult::Error:
            std::cerr << "mathexpr: " << error << "\n";
            usage(std::cerr);
            return kExitUsage;
        case CliParseResult::Run:
            break;
    }
    return runCli(opts, std::cin, std::cout, std::cerr);
}
