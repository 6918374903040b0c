#ifndef BROOTFILE_REPORT_HPP
#define BROOTFILE_REPORT_HPP

#include "DictionaryAttack.hpp"

#include <chrono>

/// \file Report.hpp
/// \brief Final summary of a dictionary attack

/// Process exit codes
enum class ExitCode
{
    Found     = 0, ///< A candidate unlocked the target
    Exhausted = 1, ///< No candidate unlocked the target
    Failure   = 2  ///< The attack could not be carried out
};

/// \brief Print a summary of the attack outcome
/// \param os Output stream
/// \param target File under attack
/// \param outcome Outcome of the attack
/// \param elapsed Duration of the attack
/// \param jobs Number of threads requested, 0 or 1 for sequential mode
/// \return the process exit code matching the outcome
auto report(std::ostream& os, const Target& target, const Outcome& outcome, std::chrono::duration<double> elapsed,
            int jobs) -> int;

/// \brief Print why the attack stopped before the summary
///
/// The option to resume is printed only if the attack was interrupted without a result.
/// \param resumeSkip Value of the --skip option resuming after the claimed candidates
void reportStop(std::ostream& os, const Outcome& outcome, Progress::State state, std::uint64_t resumeSkip);

#endif // BROOTFILE_REPORT_HPP
