#include "Report.hpp"

#include "log.hpp"

#include <iomanip>
#include <type_traits>

namespace
{

void printStatistics(std::ostream& os, std::uint64_t attempts, std::chrono::duration<double> elapsed, int jobs)
{
    const auto flagsBefore     = os.setf(std::ios::fixed, std::ios::floatfield);
    const auto precisionBefore = os.precision();

    const auto seconds = elapsed.count();
    os << "Attempts: " << attempts << "\n"
       << "Time: " << std::setprecision(2) << seconds << " s\n"
       << "Speed: " << std::setprecision(1) << (seconds > 0 ? attempts / seconds : 0.0) << " attempts/s\n";

    os.precision(precisionBefore);
    os.flags(flagsBefore);

    if (jobs > 1)
        os << "Mode: multi-threaded (" << jobs << " threads)" << std::endl;
    else
        os << "Mode: sequential" << std::endl;
}

} // namespace

auto report(std::ostream& os, const Target& target, const Outcome& outcome, std::chrono::duration<double> elapsed,
            int jobs) -> int
{
    return std::visit(
        [&](const auto& result) -> int
        {
            using T = std::decay_t<decltype(result)>;
            if constexpr (std::is_same_v<T, Found>)
            {
                os << "Password found for " << target.getPath() << "\n"
                   << "as text: " << result.credential << "\n"
                   << "File type: " << target.getKind() << "\n";
                printStatistics(os, result.attempts, elapsed, jobs);
                return static_cast<int>(ExitCode::Found);
            }
            else if constexpr (std::is_same_v<T, Exhausted>)
            {
                os << "Password not found in wordlist" << std::endl;
                printStatistics(os, result.attempts, elapsed, jobs);
                return static_cast<int>(ExitCode::Exhausted);
            }
            else
            {
                os << "Attack aborted: " << result.reason << "\n"
                   << "Attempts before stopping: " << result.attempts << std::endl;
                return static_cast<int>(ExitCode::Failure);
            }
        },
        outcome);
}

void reportStop(std::ostream& os, const Outcome& outcome, Progress::State state, std::uint64_t resumeSkip)
{
    if (std::holds_alternative<Found>(outcome))
        os << "Found a solution. Stopping." << std::endl;
    else if (state == Progress::State::Canceled && std::holds_alternative<Aborted>(outcome))
    {
        os << "Operation interrupted by user." << std::endl;
        os << "You may resume the attack with the option: --skip " << resumeSkip << std::endl;
    }
}
