#include "Zip.hpp"

#include "file.hpp"

#include <zlib.h>

#include <algorithm>
#include <optional>

namespace
{

template <typename T>
auto readInt(std::istream& is) -> T
{
    // We make no assumption about platform endianness.
    auto x = T{};
    for (auto index = std::size_t{}; index < sizeof(T); index++)
        x |= static_cast<T>(is.get()) << (8 * index);

    return x;
}

auto readString(std::istream& is, std::size_t length) -> std::string
{
    auto string = std::string{};
    string.resize(length);
    is.read(string.data(), string.size());
    return string;
}

enum class Signature : std::uint32_t
{
    LocalFileHeader        = 0x04034b50,
    CentralDirectoryHeader = 0x02014b50,
    Zip64Eocd              = 0x06064b50,
    Zip64EocdLocator       = 0x07064b50,
    Eocd                   = 0x06054b50
};

auto checkSignature(std::istream& is, const Signature& signature) -> bool
{
    const auto sig = readInt<std::uint32_t>(is);
    return is && sig == static_cast<std::uint32_t>(signature);
}

auto findCentralDirectoryOffset(std::istream& is) -> std::uint64_t
{
    auto centralDirectoryOffset = std::uint64_t{};

    // find end of central directory signature
    {
        auto signature     = std::uint32_t{};
        auto commentLength = std::uint16_t{};
        do
        {
            is.seekg(-22 - commentLength, std::ios::end);
            signature = readInt<std::uint32_t>(is);
        } while (is && signature != static_cast<std::uint32_t>(Signature::Eocd) && commentLength++ < mask<0, 16>);

        if (!is || signature != static_cast<std::uint32_t>(Signature::Eocd))
            throw Zip::Error{"could not find end of central directory signature"};
    }

    // read end of central directory record
    {
        const auto disk = readInt<std::uint16_t>(is);
        is.seekg(10, std::ios::cur);
        centralDirectoryOffset = readInt<std::uint32_t>(is);

        if (!is)
            throw Zip::Error{"could not read end of central directory record"};
        if (disk != 0)
            throw Zip::Error{"split zip archives are not supported"};
    }

    // look for Zip64 end of central directory locator
    is.seekg(-40, std::ios::cur);
    if (checkSignature(is, Signature::Zip64EocdLocator))
    {
        is.seekg(4, std::ios::cur);
        const auto zip64EndOfCentralDirectoryOffset = readInt<std::uint64_t>(is);

        if (!is)
            throw Zip::Error{"could not read Zip64 end of central directory locator record"};

        // read Zip64 end of central directory record
        is.seekg(zip64EndOfCentralDirectoryOffset, std::ios::beg);
        if (checkSignature(is, Signature::Zip64Eocd))
        {
            is.seekg(10, std::ios::cur);
            const auto versionNeededToExtract = readInt<std::uint16_t>(is);
            is.seekg(32, std::ios::cur);
            centralDirectoryOffset = readInt<std::uint64_t>(is);

            if (!is)
                throw Zip::Error{"could not read Zip64 end of central directory record"};
            if (versionNeededToExtract >= 62) // Version 6.2 introduces central directory encryption.
                throw Zip::Error{"central directory encryption is not supported"};
        }
        else
            throw Zip::Error{"could not find Zip64 end of central directory record"};
    }
    else
        is.clear(); // the locator is optional, reading past it is not an error

    return centralDirectoryOffset;
}

// Extra field values that override or complete a central directory header
struct ExtraField
{
    struct Aes
    {
        std::uint8_t  strength;
        std::uint16_t method; ///< actual compression method
    };

    struct UnicodePath
    {
        std::uint32_t nameCrc32; ///< CRC-32 of the header file name it replaces
        std::string   name;
    };

    std::optional<Aes>           aes;
    std::optional<UnicodePath>   unicodePath;
    std::optional<std::uint64_t> uncompressedSize;
    std::optional<std::uint64_t> compressedSize;
    std::optional<std::uint64_t> headerOffset;
};

constexpr auto zip64HeaderId       = std::uint16_t{0x0001};
constexpr auto unicodePathHeaderId = std::uint16_t{0x7075};
constexpr auto aesHeaderId         = std::uint16_t{0x9901};

// Zip64 values are present only for header values set to 0xffffffff, in this order
void readZip64(std::istream& is, std::uint16_t dataSize, const std::array<std::uint32_t, 3>& values,
               ExtraField& extra)
{
    const auto fields = std::array{&extra.uncompressedSize, &extra.compressedSize, &extra.headerOffset};
    for (auto i = std::size_t{}; i < fields.size(); i++)
        if (8 <= dataSize && values[i] == mask<0, 32>)
        {
            *fields[i] = readInt<std::uint64_t>(is);
            dataSize -= 8;
        }

    is.ignore(dataSize); // disk start number

    if (!is)
        throw Zip::Error{"could not read ZIP64 extra field"};
}

void readUnicodePath(std::istream& is, std::uint16_t dataSize, ExtraField& extra)
{
    if (dataSize < 5)
        throw Zip::Error{"could not read Info-Zip Unicode Path extra field"};

    is.ignore(1); // version
    const auto nameCrc32 = readInt<std::uint32_t>(is);
    auto       name      = readString(is, dataSize - 5);

    if (!is)
        throw Zip::Error{"could not read Info-Zip Unicode Path extra field"};

    extra.unicodePath = ExtraField::UnicodePath{nameCrc32, std::move(name)};
}

void readAes(std::istream& is, std::uint16_t dataSize, ExtraField& extra)
{
    if (dataSize != 7)
        throw Zip::Error{"could not read AES extra field"};

    is.ignore(4); // vendor version, vendor id
    const auto strength = readInt<std::uint8_t>(is);
    const auto method   = readInt<std::uint16_t>(is);

    if (!is)
        throw Zip::Error{"could not read AES extra field"};

    extra.aes = ExtraField::Aes{strength, method};
}

auto readExtraField(std::istream& is, std::uint16_t size, const std::array<std::uint32_t, 3>& zip64Values)
    -> ExtraField
{
    auto extra = ExtraField{};
    while (size)
    {
        if (size < 4)
            throw Zip::Error{"could not read extra field"};

        const auto headerId = readInt<std::uint16_t>(is);
        const auto dataSize = readInt<std::uint16_t>(is);
        size -= 4;

        if (!is || size < dataSize)
            throw Zip::Error{"could not read extra field"};

        switch (headerId)
        {
        case zip64HeaderId:
            readZip64(is, dataSize, zip64Values, extra);
            break;
        case unicodePathHeaderId:
            readUnicodePath(is, dataSize, extra);
            break;
        case aesHeaderId:
            readAes(is, dataSize, extra);
            break;
        default:
            is.ignore(dataSize);
            if (!is)
                throw Zip::Error{"could not read extra field"};
            break;
        }
        size -= dataSize;
    }

    return extra;
}

auto getEncryption(std::uint16_t flags, std::uint16_t method, const ExtraField& extra) -> Zip::Encryption
{
    if (!(flags & 1))
        return Zip::Encryption::None;
    if ((flags >> 6) & 1) // strong encryption
        return Zip::Encryption::Unsupported;
    if (method == 99)
        return extra.aes ? Zip::Encryption::Aes : Zip::Encryption::Unsupported;
    return Zip::Encryption::Traditional;
}

// Read a central directory header, after its signature
auto readEntry(std::istream& is) -> Zip::Entry
{
    is.ignore(4); // version made by, version needed to extract
    const auto flags       = readInt<std::uint16_t>(is);
    const auto method      = readInt<std::uint16_t>(is);
    const auto lastModTime = readInt<std::uint16_t>(is);
    is.ignore(2); // last modification date
    const auto crc32             = readInt<std::uint32_t>(is);
    const auto compressedSize    = readInt<std::uint32_t>(is);
    const auto uncompressedSize  = readInt<std::uint32_t>(is);
    const auto filenameLength    = readInt<std::uint16_t>(is);
    const auto extraFieldLength  = readInt<std::uint16_t>(is);
    const auto fileCommentLength = readInt<std::uint16_t>(is);
    is.ignore(8); // disk start number, internal and external file attributes
    const auto headerOffset = readInt<std::uint32_t>(is);
    const auto filename     = readString(is, filenameLength);
    const auto extra = readExtraField(is, extraFieldLength, {uncompressedSize, compressedSize, headerOffset});
    is.ignore(fileCommentLength);

    if (!is)
        throw Zip::Error{"could not read central directory header"};

    auto entry = Zip::Entry{};
    entry.name = extra.unicodePath &&
                         ::crc32_z(0L, reinterpret_cast<const Bytef*>(filename.data()), filename.size()) ==
                             extra.unicodePath->nameCrc32
                     ? extra.unicodePath->name
                     : filename;
    entry.encryption       = getEncryption(flags, method, extra);
    entry.compression      = static_cast<Zip::Compression>(extra.aes ? extra.aes->method : method);
    entry.crc32            = crc32;
    entry.offset           = extra.headerOffset.value_or(headerOffset);
    entry.packedSize       = extra.compressedSize.value_or(compressedSize);
    entry.uncompressedSize = extra.uncompressedSize.value_or(uncompressedSize);
    // with a data descriptor, the check byte comes from the last modification time
    entry.checkByte   = (flags >> 3) & 1 ? lsb(lastModTime >> 8) : msb(crc32);
    entry.aesStrength = entry.encryption == Zip::Encryption::Aes ? extra.aes->strength : 0;

    return entry;
}

auto readCentralDirectory(std::istream& is) -> std::vector<Zip::Entry>
{
    is.seekg(findCentralDirectoryOffset(is), std::ios::beg);

    auto entries = std::vector<Zip::Entry>{};
    while (checkSignature(is, Signature::CentralDirectoryHeader))
        entries.push_back(readEntry(is));
    is.clear(); // the central directory ends with another signature

    return entries;
}

} // namespace

Zip::Error::Error(const std::string& description)
: BaseError{"Zip error", description}
{
}

Zip::Zip(const std::string& filename)
: m_is{openInput(filename)}
, m_entries{readCentralDirectory(m_is)}
{
}

auto Zip::seek(const Entry& entry) const -> std::istream&
{
    m_is.clear();
    m_is.seekg(entry.offset, std::ios::beg);
    if (!checkSignature(m_is, Signature::LocalFileHeader))
        throw Error{"could not find local file header of entry \"" + entry.name + "\""};

    // skip local file header
    m_is.seekg(22, std::ios::cur);
    const auto nameSize  = readInt<std::uint16_t>(m_is);
    const auto extraSize = readInt<std::uint16_t>(m_is);
    m_is.seekg(nameSize + extraSize, std::ios::cur);

    return m_is;
}

auto Zip::load(const Entry& entry, std::size_t count) const -> std::vector<std::uint8_t>
{
    const auto size = std::min(entry.packedSize, static_cast<std::uint64_t>(count));
    auto       data = loadStream(seek(entry), size);
    if (data.size() != size)
        throw Error{"data of entry \"" + entry.name + "\" is truncated"};

    return data;
}
