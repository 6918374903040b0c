#include "Report.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace
{

class ReportTest : public ::testing::Test
{
protected:
    auto print(const Outcome& outcome, int jobs = 0) -> int
    {
        return report(os, target, outcome, std::chrono::duration<double>{2.0}, jobs);
    }

    std::ostringstream os;
    const Target       target{"secret.zip", FormatKind::ZipArchive};
};

} // namespace

TEST_F(ReportTest, FoundPrintsCredential)
{
    EXPECT_EQ(0, print(Found{"correct", 3}));

    const auto output = os.str();
    EXPECT_NE(std::string::npos, output.find("secret.zip"));
    EXPECT_NE(std::string::npos, output.find("as text: correct"));
    EXPECT_NE(std::string::npos, output.find("File type: ZIP"));
    EXPECT_NE(std::string::npos, output.find("Attempts: 3"));
    EXPECT_NE(std::string::npos, output.find("Time: 2.00 s"));
    EXPECT_NE(std::string::npos, output.find("Speed: 1.5 attempts/s"));
    EXPECT_NE(std::string::npos, output.find("Mode: sequential"));
}

TEST_F(ReportTest, ExhaustedPrintsStatistics)
{
    EXPECT_EQ(1, print(Exhausted{10}, 4));

    const auto output = os.str();
    EXPECT_NE(std::string::npos, output.find("not found"));
    EXPECT_NE(std::string::npos, output.find("Attempts: 10"));
    EXPECT_NE(std::string::npos, output.find("Speed: 5.0 attempts/s"));
    EXPECT_NE(std::string::npos, output.find("Mode: multi-threaded (4 threads)"));
}

TEST_F(ReportTest, AbortedPrintsReason)
{
    EXPECT_EQ(2, print(Aborted{"interrupted by user", 42}));

    const auto output = os.str();
    EXPECT_NE(std::string::npos, output.find("interrupted by user"));
    EXPECT_NE(std::string::npos, output.find("42"));
    EXPECT_EQ(std::string::npos, output.find("as text"));
}

TEST_F(ReportTest, InterruptionPrintsResumeOption)
{
    reportStop(os, Aborted{"interrupted by user", 42}, Progress::State::Canceled, 142);

    EXPECT_NE(std::string::npos, os.str().find("interrupted by user"));
    EXPECT_NE(std::string::npos, os.str().find("--skip 142"));
}

TEST_F(ReportTest, InterruptionAfterResultDoesNotOfferResume)
{
    reportStop(os, Found{"correct", 3}, Progress::State::Canceled, 103);

    EXPECT_NE(std::string::npos, os.str().find("Found a solution"));
    EXPECT_EQ(std::string::npos, os.str().find("interrupted"));
    EXPECT_EQ(std::string::npos, os.str().find("--skip"));
}

TEST_F(ReportTest, StructuralAbortDoesNotOfferResume)
{
    reportStop(os, Aborted{"target is corrupted", 1}, Progress::State::Normal, 1);
    EXPECT_TRUE(os.str().empty());
}

TEST_F(ReportTest, RestoresStreamFormatting)
{
    print(Found{"correct", 3});
    os.str("");
    os << 0.125;
    EXPECT_EQ("0.125", os.str());
}
