#include "TestFiles.hpp"
#include "Wordlist.hpp"
#include "file.hpp"

#include <gtest/gtest.h>

namespace
{

auto readAll(Wordlist& wordlist) -> std::vector<std::string>
{
    auto candidates = std::vector<std::string>{};
    while (const auto candidate = wordlist.next())
        candidates.push_back(*candidate);
    return candidates;
}

class WordlistTest : public ::testing::Test
{
protected:
    TemporaryDirectory directory;
};

} // namespace

TEST_F(WordlistTest, StripsLineTerminatorsAndSkipsEmptyLines)
{
    const auto path = directory.path("words.txt");
    writeText(path, "alpha\r\nbeta\n\n\r\n gamma \ndelta");

    auto wordlist = Wordlist{path};
    EXPECT_EQ((std::vector<std::string>{"alpha", "beta", " gamma ", "delta"}), readAll(wordlist));
    EXPECT_FALSE(wordlist.next());
    EXPECT_EQ(4u, wordlist.claimed());
}

TEST_F(WordlistTest, KeepsDuplicatesInFileOrder)
{
    const auto path = directory.path("words.txt");
    writeText(path, "b\na\nb\nc\n");

    auto wordlist = Wordlist{path};
    EXPECT_EQ((std::vector<std::string>{"b", "a", "b", "c"}), readAll(wordlist));
}

TEST_F(WordlistTest, EmptyFileYieldsNothing)
{
    const auto path = directory.path("empty.txt");
    writeText(path, "");

    auto wordlist = Wordlist{path};
    EXPECT_FALSE(wordlist.next());
    EXPECT_EQ(0u, wordlist.estimateTotal());
}

TEST_F(WordlistTest, RewindRestartsFromTheBeginning)
{
    const auto path = directory.path("words.txt");
    writeText(path, "one\ntwo\nthree\n");

    auto wordlist = Wordlist{path};
    const auto first = readAll(wordlist);

    wordlist.rewind();
    EXPECT_EQ(0u, wordlist.claimed());
    EXPECT_EQ(first, readAll(wordlist));
}

TEST_F(WordlistTest, SkipDiscardsCandidates)
{
    const auto path = directory.path("words.txt");
    writeText(path, "one\n\ntwo\nthree\nfour\n");

    auto wordlist = Wordlist{path};
    EXPECT_EQ(2u, wordlist.skip(2));
    EXPECT_EQ(0u, wordlist.claimed());
    EXPECT_EQ((std::vector<std::string>{"three", "four"}), readAll(wordlist));
    EXPECT_EQ(2u, wordlist.estimateTotal());

    wordlist.rewind();
    EXPECT_EQ(4u, wordlist.skip(10));
    EXPECT_FALSE(wordlist.next());
}

TEST_F(WordlistTest, EstimateIsExactAtEndOfFile)
{
    const auto path = directory.path("words.txt");
    auto       content = std::string{};
    for (auto i = 0; i < 100; i++)
        content += "password" + std::to_string(i % 10) + "\n";
    writeText(path, content);

    auto wordlist = Wordlist{path};
    EXPECT_EQ(0u, wordlist.estimateTotal());

    ASSERT_TRUE(wordlist.next());
    EXPECT_EQ(100u, wordlist.estimateTotal()); // all lines have the same length

    readAll(wordlist);
    EXPECT_EQ(100u, wordlist.estimateTotal());
}

TEST_F(WordlistTest, MissingFileIsFileError)
{
    EXPECT_THROW(Wordlist{directory.path("missing.txt")}, FileError);
}
