// File: tests/unit/test_expr_cli.cpp
// Purpose: Cover option decoding and output of the mathexpr driver.
// Key invariants: Usage errors never reach the parser; parse errors print a
//                 located diagnostic and yield exit status 1.
// Ownership/Lifetime: Argument storage is owned by the Args helper.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "cli.hpp"

#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

using namespace mathexpr::tools;

namespace
{

/// Owns argument strings and exposes them as an ArgvView.
struct Args
{
    std::vector<std::string> storage;
    std::vector<char *> pointers;

    Args(std::initializer_list<const char *> args) : storage(args.begin(), args.end())
    {
        for (auto &arg : storage)
            pointers.push_back(arg.data());
    }

    ArgvView view()
    {
        return ArgvView{static_cast<int>(pointers.size()), pointers.data()};
    }
};

struct RunResult
{
    int status;
    std::string out;
    std::string err;
};

RunResult run(std::initializer_list<const char *> argv, const std::string &input = {})
{
    Args args(argv);
    CliOptions opts;
    std::string error;
    if (parseCommandLine(args.view(), opts, error) != CliParseResult::Run)
        return {kExitUsage, {}, error};

    std::istringstream in(input);
    std::ostringstream out;
    std::ostringstream err;
    const int status = runCli(opts, in, out, err);
    return {status, out.str(), err.str()};
}

} // namespace

TEST(ExprCli, JoinsOperandsAndEmitsString)
{
    const auto result = run({"2", "+", "3", "*", "4"});
    EXPECT_EQ(result.status, kExitOk);
    EXPECT_EQ(result.out, "binExp(2, +, binExp(3, *, 4))\n");
    EXPECT_TRUE(result.err.empty());
}

TEST(ExprCli, NegativeNumberIsAnOperand)
{
    Args args{"-3"};
    CliOptions opts;
    std::string error;
    ASSERT_EQ(parseCommandLine(args.view(), opts, error), CliParseResult::Run);
    EXPECT_EQ(opts.expression, "-3");
    EXPECT_FALSE(opts.readStdin);
}

TEST(ExprCli, EmitMathML)
{
    const auto result = run({"--emit=mathml", "--no-wrap", "a/b"});
    EXPECT_EQ(result.status, kExitOk);
    EXPECT_EQ(result.out, "<mfrac><mi>a</mi><mi>b</mi></mfrac>\n");

    const auto wrapped = run({"--emit=mathml", "x"});
    EXPECT_EQ(wrapped.out, "<math xmlns=\"http://www.w3.org/1998/Math/MathML\"><mi>x</mi></math>\n");
}

TEST(ExprCli, EmitAst)
{
    const auto result = run({"--emit=ast", "x"});
    EXPECT_EQ(result.status, kExitOk);
    EXPECT_EQ(result.out, "Identifier \"x\" [0, 1)\n");
}

TEST(ExprCli, ReadsStandardInput)
{
    const auto implicit = run({}, "1 - 2\n");
    EXPECT_EQ(implicit.status, kExitOk);
    EXPECT_EQ(implicit.out, "binExp(1, -, 2)\n");

    const auto dash = run({"-"}, "f(x)");
    EXPECT_EQ(dash.out, "f(x)\n");
}

TEST(ExprCli, ParseErrorPrintsDiagnostic)
{
    const auto result = run({"1 +"});
    EXPECT_EQ(result.status, kExitParseError);
    EXPECT_TRUE(result.out.empty());
    EXPECT_EQ(result.err,
              "<expr>:1:4: error[E0001]: expected primary expression but found end of input\n");

    const auto fromStdin = run({}, "(1");
    EXPECT_EQ(fromStdin.status, kExitParseError);
    EXPECT_EQ(fromStdin.err.rfind("<stdin>:1:3: error[E0003]", 0), 0u);
}

TEST(ExprCli, LenientFlag)
{
    const auto strict = run({"(1 + 2"});
    EXPECT_EQ(strict.status, kExitParseError);

    const auto lenient = run({"--lenient", "(1 + 2"});
    EXPECT_EQ(lenient.status, kExitOk);
    EXPECT_EQ(lenient.out, "binExp(1, +, 2)\n");
    EXPECT_EQ(lenient.err, "<expr>:1:7: warning[E0003]: missing ')' to close '(' at offset 0\n");
}

TEST(ExprCli, LenientWarningsPrecedeError)
{
    const auto result = run({"--lenient", "[(1, )"});
    EXPECT_EQ(result.status, kExitParseError);
    EXPECT_TRUE(result.out.empty());
    EXPECT_EQ(result.err,
              "<expr>:1:4: warning[E0003]: missing ')' to close '(' at offset 1\n"
              "<expr>:1:6: error[E0001]: expected primary expression but found ')'\n");

    const auto repaired = run({"--lenient", "(x) y"});
    EXPECT_EQ(repaired.status, kExitOk);
    EXPECT_EQ(repaired.out, "x\n");
    EXPECT_EQ(repaired.err, "<expr>:1:5: warning[E0005]: ignored trailing input starting at 'y'\n");
}

TEST(ExprCli, UsageErrors)
{
    const auto badEmit = run({"--emit=svg", "x"});
    EXPECT_EQ(badEmit.status, kExitUsage);
    EXPECT_NE(badEmit.err.find("svg"), std::string::npos);

    const auto unknown = run({"--frobnicate", "x"});
    EXPECT_EQ(unknown.status, kExitUsage);

    const auto mixed = run({"-", "x"});
    EXPECT_EQ(mixed.status, kExitUsage);
}

TEST(ExprCli, DoubleDashEndsOptions)
{
    Args args{"--", "--x"};
    CliOptions opts;
    std::string error;
    ASSERT_EQ(parseCommandLine(args.view(), opts, error), CliParseResult::Run);
    EXPECT_EQ(opts.expression, "--x");
}

TEST(ExprCli, HelpAndVersion)
{
    CliOptions opts;
    std::string error;
    Args help{"--help"};
    EXPECT_EQ(parseCommandLine(help.view(), opts, error), CliParseResult::Help);
    Args version{"x", "--version"};
    EXPECT_EQ(parseCommandLine(version.view(), opts, error), CliParseResult::Version);

    std::ostringstream os;
    usage(os);
    EXPECT_NE(os.str().find("--emit=string|mathml|ast"), std::string::npos);
}

TEST(ExprCli, FlagsReachOptions)
{
    Args args{"--trace", "--pretty", "--no-wrap", "--lenient", "y"};
    CliOptions opts;
    std::string error;
    ASSERT_EQ(parseCommandLine(args.view(), opts, error), CliParseResult::Run);
    EXPECT_TRUE(opts.parse.trace);
    EXPECT_FALSE(opts.parse.strict);
    EXPECT_TRUE(opts.mathml.pretty);
    EXPECT_FALSE(opts.mathml.wrapInMath);
    EXPECT_EQ(opts.emit, EmitKind::String);
}
