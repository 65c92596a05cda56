// File: src/tools/mathexpr/cli.hpp
// Purpose: Option parsing and execution for the mathexpr driver.
// Key invariants: Parsing never touches the streams; running never exits.
// Ownership/Lifetime: CliOptions owns the joined expression text.
// Links: DESIGN.md

#pragma once

#include "support/options.hpp"
#include "tools/common/ArgvView.hpp"

#include <iosfwd>
#include <string>

namespace mathexpr::tools
{

/// @brief Output format selected with --emit.
enum class EmitKind
{
    String, ///< Canonical string form (default).
    MathML, ///< MathML text of the presentation markup.
    Ast,    ///< Indented tree dump with spans.
};

/// @brief Exit statuses of the driver.
enum ExitCode : int
{
    kExitOk = 0,
    kExitParseError = 1,
    kExitUsage = 2,
};

/// @brief Configuration decoded from the command line.
struct CliOptions
{
    /// @brief Operands joined with single spaces; unused when readStdin is set.
    std::string expression{};

    /// @brief Read the expression from standard input.
    bool readStdin = false;

    EmitKind emit = EmitKind::String;
    support::ParseOptions parse{};
    support::MathMLOptions mathml{};
};

/// @brief Outcome of decoding the command line.
enum class CliParseResult
{
    Run,     ///< Options decoded; run the pipeline.
    Help,    ///< --help requested.
    Version, ///< --version requested.
    Error    ///< Malformed or unknown option; see the error text.
};

/// @brief Decode @p args (program name already dropped) into @p opts.
/// @param error Receives a one-line message when the result is Error.
CliParseResult parseCommandLine(ArgvView args, CliOptions &opts, std::string &error);

/// @brief Parse the configured expression and write the selected rendering.
/// @return kExitOk, or kExitParseError after printing the diagnostic to @p err.
int runCli(const CliOptions &opts, std::istream &in, std::ostream &out, std::ostream &err);

/// @brief Print the synopsis and option summary to @p os.
void usage(std::ostream &os);

/// @brief Print the version banner to @p os.
void printVersion(std::ostream &os);

} // namespace mathexpr::tools
