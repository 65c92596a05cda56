//===----------------------------------------------------------------------===//
//
// Part of the MathExpr project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements option decoding and the parse/render pipeline for the mathexpr
// driver.  main.cpp only wires these helpers to the process streams.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Command-line decoding and execution for `mathexpr`.

#include "cli.hpp"

#include "frontends/math/AstPrinter.hpp"
#include "frontends/math/MathMLWriter.hpp"
#include "frontends/math/Markup.hpp"
#include "frontends/math/Parser.hpp"
#include "mathexpr/parse/Cursor.h"
#include "mathexpr/version.hpp"
#include "support/diagnostics.hpp"

#include <istream>
#include <iterator>
#include <ostream>
#include <string_view>

namespace mathexpr::tools
{

namespace
{

/// @brief Label used for diagnostics about the expression operand.
constexpr std::string_view kSourceName = "<expr>";

/// @brief Label used for diagnostics about standard input.
constexpr std::string_view kStdinName = "<stdin>";

bool parseEmitKind(std::string_view name, EmitKind &emit)
{
    if (name == "string")
    {
        emit = EmitKind::String;
        return true;
    }
    if (name == "mathml")
    {
        emit = EmitKind::MathML;
        return true;
    }
    if (name == "ast")
    {
        emit = EmitKind::Ast;
        return true;
    }
    return false;
}

/// @brief Drop one trailing line break so piped input parses cleanly.
void stripTrailingNewline(std::string &text)
{
    if (!text.empty() && text.back() == '\n')
        text.pop_back();
    if (!text.empty() && text.back() == '\r')
        text.pop_back();
}

} // namespace

/// @brief Decode driver options.
///
/// @details Options may appear anywhere; every other argument is an
///          expression operand.  `--` ends option processing.  A lone `-`,
///          or no operand at all, selects standard input.
CliParseResult parseCommandLine(ArgvView args, CliOptions &opts, std::string &error)
{
    bool optionsDone = false;
    bool sawOperand = false;
    bool sawDash = false;

    for (int i = 0; i < args.size(); ++i)
    {
        const std::string_view arg = args.at(i);
        if (!optionsDone && arg.size() > 1 && arg.front() == '-')
        {
            if (arg == "--")
            {
                optionsDone = true;
                continue;
            }
            if (arg == "--help" || arg == "-h")
                return CliParseResult::Help;
            if (arg == "--version")
                return CliParseResult::Version;
            if (arg == "--lenient")
            {
                opts.parse.strict = false;
                continue;
            }
            if (arg == "--trace")
            {
                opts.parse.trace = true;
                continue;
            }
            if (arg == "--no-wrap")
            {
                opts.mathml.wrapInMath = false;
                continue;
            }
            if (arg == "--pretty")
            {
                opts.mathml.pretty = true;
                continue;
            }
            if (arg.substr(0, 7) == "--emit=")
            {
                if (!parseEmitKind(arg.substr(7), opts.emit))
                {
                    error = "unknown emit kind '" + std::string(arg.substr(7)) +
                            "' (expected string, mathml or ast)";
                    return CliParseResult::Error;
                }
                continue;
            }
            // "-3" and "--3" are expressions; "--word" is an option spelling.
            if (arg.size() > 2 && arg.substr(0, 2) == "--" && parse::Cursor::isAlpha(arg[2]))
            {
                error = "unknown option '" + std::string(arg) + "'";
                return CliParseResult::Error;
            }
        }

        if (arg == "-" && !optionsDone)
        {
            sawDash = true;
            continue;
        }
        if (sawOperand)
            opts.expression += ' ';
        opts.expression += arg;
        sawOperand = true;
    }

    if (sawDash && sawOperand)
    {
        error = "cannot combine '-' with expression operands";
        return CliParseResult::Error;
    }
    opts.readStdin = !sawOperand;
    return CliParseResult::Run;
}

int runCli(const CliOptions &opts, std::istream &in, std::ostream &out, std::ostream &err)
{
    std::string text = opts.expression;
    std::string_view sourceName = kSourceName;
    if (opts.readStdin)
    {
        text.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        stripTrailingNewline(text);
        sourceName = kStdinName;
    }

    support::DiagnosticEngine diags;
    auto root = frontends::math::parseExpression(text, opts.parse, diags);
    diags.printAll(err, sourceName);
    if (diags.errorCount() != 0)
        return kExitParseError;

    switch (opts.emit)
    {
        case EmitKind::String:
            out << frontends::math::toCanonicalString(root.value()) << '\n';
            break;
        case EmitKind::MathML:
        {
            const auto markup = frontends::math::buildMarkup(root.value());
            frontends::math::writeMathML(markup, out, opts.mathml);
            if (!opts.mathml.pretty)
                out << '\n';
            break;
        }
        case EmitKind::Ast:
            out << frontends::math::dumpAst(root.value());
            break;
    }
    return kExitOk;
}

void usage(std::ostream &os)
{
    os << "mathexpr v" << MATHEXPR_VERSION_STR << "\n"
       << "Usage: mathexpr [options] <expression>...\n"
       << "       mathexpr [options] -            (read the expression from stdin)\n"
       << "\nOptions:\n"
       << "  --emit=string|mathml|ast  Output format (default: string)\n"
       << "  --lenient                 Tolerate missing ')' or ']' and trailing text\n"
       << "  --trace                   Trace parsing to stderr (also MATHEXPR_TRACE=1)\n"
       << "  --no-wrap                 Omit the <math> root element\n"
       << "  --pretty                  Indent MathML output\n"
       << "  --version                 Print version and exit\n"
       << "  --help                    Print this message and exit\n"
       << "\nOperands are joined with spaces.  Use -- before an expression that\n"
       << "starts with '--'.\n";
}

void printVersion(std::ostream &os)
{
    os << "mathexpr v" << MATHEXPR_VERSION_STR << "\n";
}

} // namespace mathexpr::tools
