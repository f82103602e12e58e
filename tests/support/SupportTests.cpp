// File: tests/support/SupportTests.cpp
// Purpose: Cover the shared diagnostic plumbing: file registration, the
//          `path:line:col: severity: message` format and the Result container.
// Key invariants: File id 0 never names a file; identical paths share an id.
// Ownership/Lifetime: Each test owns its SourceManager and engines.
// Links: src/support/source_manager.cpp, src/support/diagnostics.cpp

#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/result.hpp"
#include "support/source_manager.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <sstream>
#include <string>

namespace isle::support
{
struct SourceManagerTestAccess
{
    static void setNextFileId(SourceManager &sm, uint64_t next)
    {
        sm.nextId_ = next;
    }
};
} // namespace isle::support

using namespace isle::support;

TEST(SourceManagerTest, AssignsIdsStartingAtOne)
{
    SourceManager sm;
    EXPECT_EQ(sm.addFile("a.isle"), 1u);
    EXPECT_EQ(sm.addFile("b.isle"), 2u);
    EXPECT_EQ(sm.getPath(1), "a.isle");
    EXPECT_EQ(sm.getPath(2), "b.isle");
    EXPECT_TRUE(sm.getPath(0).empty());
    EXPECT_TRUE(sm.getPath(3).empty());
}

TEST(SourceManagerTest, NormalizedPathsShareAnId)
{
    SourceManager sm;
    const uint32_t first = sm.addFile("rules/./lower.isle");
    const uint32_t second = sm.addFile("rules/lower.isle");
    EXPECT_EQ(first, second);
    EXPECT_EQ(sm.fileCount(), 1u);
    EXPECT_EQ(sm.getPath(first), "rules/lower.isle");
}

TEST(SourceManagerTest, ReturnsZeroWhenIdsAreExhausted)
{
    SourceManager sm;
    SourceManagerTestAccess::setNextFileId(
        sm, static_cast<uint64_t>(std::numeric_limits<uint32_t>::max()) + 1);
    EXPECT_EQ(sm.addFile("late.isle"), 0u);
    EXPECT_EQ(sm.fileCount(), 0u);
}

TEST(DiagnosticsTest, PrintsPathLineAndColumn)
{
    SourceManager sm;
    const uint32_t id = sm.addFile("lower.isle");
    std::ostringstream os;
    printDiag(makeError({id, 3, 7}, "undefined term 'iadd'"), os, &sm);
    EXPECT_EQ(os.str(), "lower.isle:3:7: error: undefined term 'iadd'\n");
}

TEST(DiagnosticsTest, OmitsUnknownLocationParts)
{
    SourceManager sm;
    const uint32_t id = sm.addFile("missing.isle");
    std::ostringstream withFile;
    printDiag(makeError({id, 0, 0}, "unable to open missing.isle"), withFile, &sm);
    EXPECT_EQ(withFile.str(), "missing.isle: error: unable to open missing.isle\n");

    std::ostringstream noFile;
    printDiag(makeError({}, "no input files"), noFile, &sm);
    EXPECT_EQ(noFile.str(), "error: no input files\n");
}

TEST(DiagnosticsTest, EngineCountsAndTakesDiagnostics)
{
    DiagnosticEngine de;
    de.error({}, "first");
    de.report(Diagnostic{Severity::Warning, "careful", {}});
    de.error({}, "second");
    EXPECT_EQ(de.errorCount(), 2u);
    EXPECT_EQ(de.warningCount(), 1u);

    auto taken = de.take();
    ASSERT_EQ(taken.size(), 3u);
    EXPECT_EQ(taken[0].message, "first");
    EXPECT_EQ(taken[2].message, "second");
    EXPECT_EQ(de.errorCount(), 0u);
    EXPECT_TRUE(de.diagnostics().empty());
}

TEST(ResultTest, HoldsExactlyOneAlternative)
{
    auto ok = Result<std::string, int>::success(std::string("code"));
    ASSERT_TRUE(ok.isOk());
    EXPECT_EQ(ok.value(), "code");

    auto bad = Result<std::string, int>::failure(3);
    ASSERT_FALSE(bad.isOk());
    EXPECT_EQ(bad.error(), 3);

    // Same payload type on both sides still keeps the states apart.
    auto same = Result<std::string, std::string>::failure(std::string("oops"));
    EXPECT_FALSE(same.isOk());
    EXPECT_EQ(same.error(), "oops");
}
