// File: tests/unit/test_support_diag.cpp
// Purpose: Verify diagnostic formatting, the engine and the Expected container.
// Key invariants: Location prefix is printed only for diagnostics with a line;
//                 columns are printed 1-based.
// Ownership/Lifetime: Test owns engines and streams.
// Links: docs/codemap.md

#include "support/diag_expected.hpp"
#include "support/trace.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using namespace stagelens::support;

TEST(Diag, PrintWithAndWithoutLocation)
{
    std::ostringstream os;
    printDiag(makeError({3, 4}, "invalid syntax"), os, "demo.py");
    EXPECT_EQ(os.str(), "demo.py:3:5: error: invalid syntax\n");

    os.str("");
    printDiag(makeWarning({}, "internal note"), os);
    EXPECT_EQ(os.str(), "warning: internal note\n");
}

TEST(Diag, EngineKeepsReportOrderUntilTaken)
{
    DiagnosticEngine de;
    de.report(makeWarning({1, 0}, "w1"));
    de.report(makeError({2, 0}, "e1"));
    de.report(Diagnostic{Severity::Note, "n1", {}});
    ASSERT_EQ(de.diagnostics().size(), 3U);

    const auto taken = de.take();
    ASSERT_EQ(taken.size(), 3U);
    EXPECT_TRUE(de.diagnostics().empty());

    std::ostringstream os;
    for (const auto &d : taken)
        printDiag(d, os, "x.py");
    EXPECT_EQ(os.str(), "x.py:1:1: warning: w1\nx.py:2:1: error: e1\nnote: n1\n");
}

TEST(Expected, HoldsValueOrError)
{
    Expected<int> ok = 42;
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), 42);

    Expected<std::string> bad = makeError({1, 0}, "boom");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().message, "boom");
    EXPECT_EQ(bad.error().severity, Severity::Error);

    Expected<void> done;
    EXPECT_TRUE(done);
    Expected<void> failed = makeError({}, "nope");
    EXPECT_FALSE(failed);
}

TEST(Trace, StreamOverrideReceivesChannelPrefix)
{
    std::ostringstream os;
    setTraceStream(&os);
    EXPECT_TRUE(traceEnabled());
    trace("pipeline", "published revision 1");
    setTraceStream(nullptr);
    EXPECT_EQ(os.str(), "[pipeline] published revision 1\n");
}
