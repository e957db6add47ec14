#include "RenameUtility/RenameUtility.hpp"
#include "helpers/TestHelpers.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

class ScanRenameCandidatesTest : public TemporaryDirectoryTest
{
  protected:
    std::vector<std::pair<std::string, std::string>> Describe(const std::vector<RenameCandidate>& candidates)
    {
        std::vector<std::pair<std::string, std::string>> described;
        for (const auto& candidate : candidates)
        {
            std::string relative = fs::relative(candidate.path, rootDir).string();
            described.emplace_back(NormalizePaths({relative}).front(), candidate.newName);
        }
        return described;
    }
};

TEST_F(ScanRenameCandidatesTest, EmptyDirectory_ReturnsNoCandidates)
{
    EXPECT_TRUE(ScanRenameCandidates(rootDir).empty());
}

TEST_F(ScanRenameCandidatesTest, CollectsOnlyFilesWhoseNameChanges)
{
    CreateTestFile(rootDir / "vacation-photo-2025-10-09-21-15-39-PM.jpg");
    CreateTestFile(rootDir / "plain.txt");
    CreateTestFile(rootDir / "2025-10-09-21-15-39-PM-already-moved.jpg");
    CreateTestFile(rootDir / "sub" / "deep" / "event_-_2025-05-29_-_19-29-55.mp4");

    const auto candidates = ScanRenameCandidates(rootDir);

    using Entry = std::pair<std::string, std::string>;
    EXPECT_THAT(Describe(candidates),
                testing::UnorderedElementsAre(Entry{"vacation-photo-2025-10-09-21-15-39-PM.jpg", "2025-10-09-21-15-39-PM-vacation-photo.jpg"},
                                              Entry{"sub/deep/event_-_2025-05-29_-_19-29-55.mp4", "2025-05-29_-_19-29-55-event.mp4"}));
}

TEST_F(ScanRenameCandidatesTest, DirectoriesAreNotCandidatesButAreDescended)
{
    CreateTestFile(rootDir / "trip-2025-1-2-3-4-5-PM" / "note-2025-1-2-3-4-5-AM.txt");

    const auto candidates = ScanRenameCandidates(rootDir);

    ASSERT_EQ(1u, candidates.size());
    EXPECT_EQ("note-2025-1-2-3-4-5-AM.txt", candidates[0].path.filename().string());
    EXPECT_EQ("2025-1-2-3-4-5-AM-note.txt", candidates[0].newName);
    EXPECT_EQ((rootDir / "trip-2025-1-2-3-4-5-PM" / "2025-1-2-3-4-5-AM-note.txt").string(), candidates[0].Target().string());
}

TEST_F(ScanRenameCandidatesTest, DoesNotTouchTheFilesystem)
{
    CreateTestFile(rootDir / "clip-2025-1-2-3-4-5-PM.mov");

    const auto before = GetDirectoryTree(rootDir);
    const auto candidates = ScanRenameCandidates(rootDir);

    EXPECT_EQ(1u, candidates.size());
    EXPECT_EQ(before, GetDirectoryTree(rootDir));
}

TEST_F(ScanRenameCandidatesTest, ReportsScanningProgressForEveryFile)
{
    CreateTestFile(rootDir / "a.txt");
    CreateTestFile(rootDir / "b-2025-1-2-3-4-5-PM.txt");

    std::vector<std::size_t> processed;
    ScanRenameCandidates(rootDir,
                         [&](const RenameProgress& progress)
                         {
                             EXPECT_STREQ("scanning", progress.stage);
                             processed.push_back(progress.processed);
                         });

    EXPECT_THAT(processed, testing::ElementsAre(1u, 2u));
}
