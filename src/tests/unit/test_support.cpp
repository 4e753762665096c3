//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_support.cpp
// Purpose: Cover the support layer: source manager ids, diagnostic rendering
//          and the Expected<T> result wrapper.
// Key invariants: File id 0 never names a file; printDiag omits any location
//                 component that is unknown.
// Ownership/Lifetime: Tests own every SourceManager they create.
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_location.hpp"
#include "support/source_manager.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using namespace rosella::support;

TEST(SupportSourceManager, IdsAreStableAndNormalized)
{
    SourceManager sm;
    const uint32_t a = sm.addFile("dir/./script.rsl");
    const uint32_t b = sm.addFile("other.rsl");
    EXPECT_EQ(a, 1u);
    EXPECT_EQ(b, 2u);
    EXPECT_EQ(sm.addFile("dir/script.rsl"), a);
    EXPECT_EQ(sm.getPath(a), "dir/script.rsl");
    EXPECT_TRUE(sm.getPath(0).empty());
    EXPECT_TRUE(sm.getPath(3).empty());
}

TEST(SupportDiagnostics, FullLocationAndCode)
{
    SourceManager sm;
    SourceLoc loc{sm.addFile("demo.rsl"), 4, 9};
    std::ostringstream os;
    printDiag(makeError(loc, "NameError: use of undeclared identifier 'q'", "R3001"), os, &sm);
    EXPECT_EQ(os.str(), "demo.rsl:4:9: error[R3001]: NameError: use of undeclared identifier 'q'\n");
}

TEST(SupportDiagnostics, MissingPiecesAreOmitted)
{
    std::ostringstream noLoc;
    printDiag(makeError({}, "no command given"), noLoc);
    EXPECT_EQ(noLoc.str(), "error: no command given\n");

    std::ostringstream lineOnly;
    printDiag(Diagnostic{Severity::Warning, "careful", SourceLoc{0, 3, 0}}, lineOnly);
    EXPECT_EQ(lineOnly.str(), "3: warning: careful\n");

    std::ostringstream note;
    printDiag(Diagnostic{Severity::Note, "see here", SourceLoc{}, "R0001"}, note);
    EXPECT_EQ(note.str(), "note[R0001]: see here\n");
}

TEST(SupportDiagnostics, EngineCountsBySeverity)
{
    DiagnosticEngine engine;
    engine.report({Severity::Warning, "w", {}});
    engine.report({Severity::Note, "n", {}});
    EXPECT_EQ(engine.errorCount(), 0u);
    EXPECT_EQ(engine.warningCount(), 1u);

    engine.report(makeError({}, "e"));
    EXPECT_EQ(engine.errorCount(), 1u);
    ASSERT_EQ(engine.diagnostics().size(), 3u);

    std::ostringstream os;
    engine.printAll(os);
    EXPECT_EQ(os.str(), "warning: w\nnote: n\nerror: e\n");
}

TEST(SupportExpected, ValueAndError)
{
    Expected<int> ok(42);
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), 42);

    Expected<int> bad(makeError({}, "broken", "R0001"));
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().message, "broken");
    EXPECT_EQ(bad.error().code, "R0001");

    Expected<void> done;
    EXPECT_TRUE(done.hasValue());
    Expected<void> failed(makeError({}, "nope"));
    EXPECT_FALSE(failed);
}
