#include "ConsoleProgress.hpp"

#include <gtest/gtest.h>

#include <sstream>

TEST(ProgressTest, SnapshotWithoutEstimate)
{
    auto os       = std::ostringstream{};
    auto progress = Progress{os};
    progress.done = 5;

    const auto snapshot = progress.snapshot();
    EXPECT_EQ(5u, snapshot.attempts);
    EXPECT_FALSE(snapshot.remaining);
    EXPECT_LE(0.0, snapshot.elapsed.count());
}

TEST(ProgressTest, SnapshotRemainingNeverNegative)
{
    auto os        = std::ostringstream{};
    auto progress  = Progress{os};
    progress.done  = 30;
    progress.total = 100;
    ASSERT_TRUE(progress.snapshot().remaining);
    EXPECT_EQ(70u, *progress.snapshot().remaining);

    progress.done = 120;
    EXPECT_EQ(0u, *progress.snapshot().remaining);
}

TEST(ProgressTest, LogWritesToStream)
{
    auto os       = std::ostringstream{};
    auto progress = Progress{os};
    progress.log([](std::ostream& stream) { stream << "hello" << std::endl; });

    EXPECT_EQ("hello\n", os.str());
}

TEST(ProgressTest, SnapshotPrinting)
{
    auto os = std::ostringstream{};
    os << Progress::Snapshot{10, std::chrono::duration<double>{4.0}, 90};

    EXPECT_EQ("Attempts: 10 | Speed: 2.5/s | Elapsed: 4.0 s | Remaining: ~90", os.str());
}

TEST(ProgressTest, ConsolePrintsFinalLine)
{
    auto os = std::ostringstream{};
    {
        auto progress = ConsoleProgress{os, std::chrono::hours{1}};
        progress.done = 7;
    }

    EXPECT_NE(std::string::npos, os.str().find("Attempts: 7"));
    EXPECT_EQ('\n', os.str().back());
}

TEST(ProgressTest, ConsoleSilentWithoutAttempts)
{
    auto os = std::ostringstream{};
    {
        auto progress = ConsoleProgress{os, std::chrono::hours{1}};
    }

    EXPECT_TRUE(os.str().empty());
}
