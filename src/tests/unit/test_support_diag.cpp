// File: tests/unit/test_support_diag.cpp
// Purpose: Verify diagnostic formatting, error codes, and the Expected carrier.
// Key invariants: printDiag prints 1-based columns and the stable error id.
// Ownership/Lifetime: Tests own all diagnostics and streams.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_location.hpp"

#include <sstream>
#include <string>

using namespace mathexpr::support;

TEST(SupportDiag, ErrorCodesHaveStableIds)
{
    EXPECT_STREQ(errorCodeId(ErrorCode::UnexpectedCharacter), "E0001");
    EXPECT_STREQ(errorCodeId(ErrorCode::ExpectedIdentifier), "E0002");
    EXPECT_STREQ(errorCodeId(ErrorCode::UnterminatedStructure), "E0003");
    EXPECT_STREQ(errorCodeId(ErrorCode::InvalidNumber), "E0004");
    EXPECT_STREQ(errorCodeId(ErrorCode::TrailingInput), "E0005");
    EXPECT_STREQ(errorCodeId(ErrorCode::NestingTooDeep), "E0006");
    EXPECT_STREQ(errorCodeName(ErrorCode::TrailingInput), "trailing-input");
}

TEST(SupportDiag, PrintDiagWithSourceName)
{
    const Diag diag = makeError(SourceLoc{3, 1, 3}, "boom", ErrorCode::UnexpectedCharacter);
    std::ostringstream os;
    printDiag(diag, os, "<expr>");
    EXPECT_EQ(os.str(), "<expr>:1:4: error[E0001]: boom\n");
}

TEST(SupportDiag, PrintDiagWithoutSourceName)
{
    const Diag diag = makeError(SourceLoc{0, 1, 0}, "bad", ErrorCode::TrailingInput);
    std::ostringstream os;
    printDiag(diag, os);
    EXPECT_EQ(os.str(), "error[E0005]: bad\n");
}

TEST(SupportDiag, EngineCountsOnlyErrors)
{
    DiagnosticEngine engine;
    engine.report(makeWarning(SourceLoc{2, 1, 2}, "careful", ErrorCode::UnterminatedStructure));
    EXPECT_EQ(engine.errorCount(), 0u);
    engine.report(makeError(SourceLoc{0, 1, 0}, "first", ErrorCode::UnexpectedCharacter));

    EXPECT_EQ(engine.errorCount(), 1u);
    ASSERT_EQ(engine.diagnostics().size(), 2u);
    EXPECT_EQ(engine.diagnostics()[0].severity, Severity::Warning);

    std::ostringstream os;
    engine.printAll(os, "<expr>");
    EXPECT_EQ(os.str(),
              "<expr>:1:3: warning[E0003]: careful\n"
              "<expr>:1:1: error[E0001]: first\n");
}

TEST(SupportDiag, ExpectedCarriesValueOrError)
{
    Expected<int> ok = 42;
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), 42);

    Expected<int> failed = makeError(SourceLoc{5, 1, 5}, "nope", ErrorCode::InvalidNumber);
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().loc.offset, 5u);
    EXPECT_EQ(failed.error().code, ErrorCode::InvalidNumber);

    Expected<void> done;
    EXPECT_TRUE(done);
    Expected<void> broken = makeError(SourceLoc{}, "x", ErrorCode::TrailingInput);
    EXPECT_FALSE(broken);
    EXPECT_EQ(broken.takeError().message, "x");
}

TEST(SupportDiag, SpanJoinCoversBoth)
{
    const Span joined = join(Span{2, 4}, Span{7, 9});
    EXPECT_EQ(joined, (Span{2, 9}));
    EXPECT_EQ(joined.length(), 7u);
    EXPECT_TRUE(joined.contains(8));
    EXPECT_FALSE(joined.contains(9));
    EXPECT_TRUE((Span{3, 3}).empty());
}
