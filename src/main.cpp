#include "Arguments.hpp"
#include "ConsoleProgress.hpp"
#include "DictionaryAttack.hpp"
#include "Report.hpp"
#include "SigintHandler.hpp"
#include "Target.hpp"
#include "ValidatorRegistry.hpp"
#include "Wordlist.hpp"
#include "ZipValidator.hpp"
#include "log.hpp"
#include "version.hpp"

#include <algorithm>
#include <iomanip>
#include <tuple>

namespace
{

const char* const usage = R"_(usage: brootfile TARGET_FILE WORDLIST_FILE [options]
       brootfile --list-formats | --version | -h, --help
Find the password of an encrypted file by trying every line of a wordlist.

Arguments:
 TARGET_FILE                 Encrypted file to unlock. Its format is detected
                              from its extension, or from its first bytes if
                              the extension is not recognized.
 WORDLIST_FILE               Password candidates, one per line. Empty lines
                              are skipped.

Options:
 -t, --threads <count>       Number of threads trying candidates concurrently.
                              With 0 (default) or 1, candidates are tried one
                              after the other in wordlist order.
     --skip <count>          Skip the given number of candidates at the
                              beginning of the wordlist. Useful to resume an
                              interrupted attack.
     --progress <ms>         Interval between progress updates in milliseconds
                              (default: 200)

Other options:
     --list-formats          List supported file formats and whether the tools
                              they need are installed, then exit
     --version               Show version information and exit
 -h, --help                  Show this help and exit

Exit status:
 0 if the password was found, 1 if no candidate matched, 2 on error)_";

void listFormats(const ValidatorRegistry& registry);

void describeEntry(const Zip::Entry& entry);

} // namespace

auto main(int argc, const char* argv[]) -> int
try
{
    // version information
    std::cout << "brootfile " << brootfileVersion << " - " << brootfileVersionDate << std::endl;

    const auto args = Arguments{argc, argv};
    if (args.help)
    {
        std::cout << usage << std::endl;
        return 0;
    }

    if (args.version)
    {
        // version information was already printed, nothing else to do
        return 0;
    }

    const auto registry = ValidatorRegistry{ToolLocator::fromEnvironment()};

    if (args.listFormats)
    {
        listFormats(registry);
        return 0;
    }

    const auto target = Target{*args.targetFile};
    std::cout << "[" << put_time << "] Target " << target.getPath() << " (" << target.getKind() << ")" << std::endl;

    const auto validator = registry.resolve(target);
    if (const auto zipValidator = dynamic_cast<const ZipValidator*>(validator.get()))
        describeEntry(zipValidator->getEntry());

    auto wordlist = Wordlist{*args.wordlistFile};
    if (args.skip)
    {
        const auto skipped = wordlist.skip(args.skip);
        std::cout << "[" << put_time << "] Skipped " << skipped << " candidates" << std::endl;
    }

    std::cout << "[" << put_time << "] Dictionary attack using " << *args.wordlistFile;
    if (args.jobs > 1)
        std::cout << " on " << args.jobs << " threads";
    std::cout << std::endl;

    const auto [outcome, elapsed, state] = [&]() -> std::tuple<Outcome, std::chrono::duration<double>, Progress::State>
    {
        auto       progress      = ConsoleProgress{std::cout, args.progressInterval};
        const auto sigintHandler = SigintHandler{progress.state};
        auto       outcome       = dictionaryAttack(wordlist, target, *validator, args.jobs, progress);
        return {std::move(outcome), progress.snapshot().elapsed, progress.state};
    }();

    reportStop(std::cout, outcome, state, args.skip + wordlist.claimed());

    std::cout << "[" << put_time << "] ";
    return report(std::cout, target, outcome, elapsed, args.jobs);
}
catch (const Arguments::Error& e)
{
    std::cout << e.what() << std::endl;
    std::cout << "Run 'brootfile -h' for help." << std::endl;
    return static_cast<int>(ExitCode::Failure);
}
catch (const BaseError& e)
{
    std::cout << e.what() << std::endl;
    return static_cast<int>(ExitCode::Failure);
}

namespace
{

void listFormats(const ValidatorRegistry& registry)
{
    const auto& backends = registry.availability();

    std::cout << "Format  Available  Extensions              Backend" << std::endl;
    for (const auto kind : allFormatKinds)
    {
        auto extensions = std::string{};
        for (const auto& extension : getFormatExtensions(kind))
            extensions += (extensions.empty() ? "" : " ") + extension;

        const auto backend = std::find_if(backends.begin(), backends.end(),
                                          [kind](const ValidatorRegistry::Backend& b) { return b.kind == kind; });

        // clang-format off
        std::cout << std::setw(6) << std::left << getFormatName(kind) << "  "
                  << std::setw(9) << (backend != backends.end() && backend->available ? "yes" : "no") << "  "
                  << std::setw(22) << extensions << "  ";
        // clang-format on

        if (backend == backends.end())
            std::cout << "unsupported";
        else
        {
            std::cout << backend->dependency;
            if (backend->tool)
                std::cout << " (" << *backend->tool << ")";
            else if (!backend->available)
                std::cout << " missing: " << backend->hint;
        }
        std::cout << std::right << std::endl;
    }
}

auto getEncryptionDescription(Zip::Encryption encryption, std::uint8_t aesStrength) -> std::string
{
    switch (encryption)
    {
    case Zip::Encryption::None:
        return "None";
    case Zip::Encryption::Traditional:
        return "ZipCrypto";
    case Zip::Encryption::Aes:
        return "AES-" + std::to_string(64 + 64 * aesStrength);
    case Zip::Encryption::Unsupported:
        break;
    }

    return "Other";
}

auto getCompressionDescription(Zip::Compression compression) -> std::string
{
    switch (compression)
    {
#define CASE(c)                                                                                                        \
    case Zip::Compression::c:                                                                                          \
        return #c
        CASE(Store);
        CASE(Shrink);
        CASE(Implode);
        CASE(Deflate);
        CASE(Deflate64);
        CASE(BZip2);
        CASE(LZMA);
        CASE(Zstandard);
        CASE(MP3);
        CASE(XZ);
        CASE(JPEG);
        CASE(WavPack);
        CASE(PPMd);
#undef CASE
    }

    return "Other (" + std::to_string(static_cast<int>(compression)) + ")";
}

void describeEntry(const Zip::Entry& entry)
{
    std::cout << "[" << put_time << "] Testing candidates on entry " << entry.name << " ("
              << getEncryptionDescription(entry.encryption, entry.aesStrength) << ", "
              << getCompressionDescription(entry.compression) << ", " << entry.packedSize << " bytes)" << std::endl;
}

} // namespace
