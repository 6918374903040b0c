#include "TestFiles.hpp"
#include "Zip.hpp"

#include <gtest/gtest.h>

#include <zlib.h>

#include <iterator>

namespace
{

auto checksum(const std::string& data) -> std::uint32_t
{
    return static_cast<std::uint32_t>(crc32_z(0L, reinterpret_cast<const Bytef*>(data.data()), data.size()));
}

class ZipTest : public ::testing::Test
{
protected:
    auto write(const std::vector<std::uint8_t>& archive) -> std::string
    {
        const auto path = directory.path("archive.zip");
        writeBytes(path, archive);
        return path;
    }

    TemporaryDirectory directory;
};

} // namespace

TEST_F(ZipTest, ListsEntriesInCentralDirectoryOrder)
{
    const auto archive = Zip{write(makeZip({
        {"plain.txt", "hello world", std::nullopt},
        {"stored.txt", "stored content", "pw"},
        {"deflated.txt", std::string(200, 'a'), "pw", true},
    }))};

    ASSERT_EQ(3u, archive.size());
    auto it = archive.begin();

    EXPECT_EQ("plain.txt", it->name);
    EXPECT_EQ(Zip::Encryption::None, it->encryption);
    EXPECT_EQ(Zip::Compression::Store, it->compression);
    EXPECT_EQ(11u, it->packedSize);
    EXPECT_EQ(checksum("hello world"), it->crc32);

    ++it;
    EXPECT_EQ("stored.txt", it->name);
    EXPECT_EQ(Zip::Encryption::Traditional, it->encryption);
    EXPECT_EQ(12u + 14u, it->packedSize);
    EXPECT_EQ(14u, it->uncompressedSize);
    EXPECT_EQ(msb(checksum("stored content")), it->checkByte);
    EXPECT_EQ(0, it->aesStrength);

    ++it;
    EXPECT_EQ("deflated.txt", it->name);
    EXPECT_EQ(Zip::Compression::Deflate, it->compression);
    EXPECT_EQ(200u, it->uncompressedSize);
    EXPECT_LT(it->packedSize, 200u);

    EXPECT_TRUE(std::next(it) == archive.end());
}

TEST_F(ZipTest, ReadsAesExtraField)
{
    const auto archive = Zip{write(makeAesZip("secret.txt", "content", "password"))};

    ASSERT_EQ(1u, archive.size());
    EXPECT_EQ(Zip::Encryption::Aes, archive.begin()->encryption);
    EXPECT_EQ(Zip::Compression::Store, archive.begin()->compression);
    EXPECT_EQ(3, archive.begin()->aesStrength);
}

TEST_F(ZipTest, LoadsRawData)
{
    const auto archive = Zip{write(makeZip({{"plain.txt", "hello world", std::nullopt}}))};
    const auto entry   = *archive.begin();

    const auto data = archive.load(entry);
    EXPECT_EQ("hello world", std::string(data.begin(), data.end()));

    const auto prefix = archive.load(entry, 5);
    EXPECT_EQ("hello", std::string(prefix.begin(), prefix.end()));
}

TEST_F(ZipTest, LoadTruncatedEntryThrows)
{
    const auto archive = Zip{write(makeZip({{"plain.txt", "hello world", std::nullopt}}))};
    auto       entry   = *archive.begin();
    entry.packedSize   = 1000;

    EXPECT_THROW(archive.load(entry), Zip::Error);
}

TEST_F(ZipTest, EmptyArchive)
{
    EXPECT_EQ(0u, Zip{write(makeZip({}))}.size());
}

TEST_F(ZipTest, NotAZipArchive)
{
    const auto path = directory.path("notes.zip");
    writeText(path, "just some text");
    EXPECT_THROW(Zip{path}, Zip::Error);
}
