#ifndef BROOTFILE_PROCESS_HPP
#define BROOTFILE_PROCESS_HPP

#include "types.hpp"

/// \file Process.hpp
/// \brief Running an external program to completion

/// Outcome of a child process
struct ProcessResult
{
    int         exitCode; ///< Exit status, or -1 if the process was killed by a signal
    int         signal;   ///< Signal which killed the process, or 0
    std::string output;   ///< Standard output and standard error, interleaved and truncated to maxOutputSize

    /// Maximum number of bytes of output kept
    static constexpr std::size_t maxOutputSize = 1 << 16;
};

/// Exit status of a child process which could not execute the requested program
constexpr auto execFailureExitCode = 127;

/// \brief Run a program and wait for its termination
///
/// The program is executed directly, without a shell, with the given arguments.
/// The \a input string is written to its standard input, which is closed afterwards.
/// Its standard output and standard error are captured together.
///
/// \param program Path to the executable
/// \param arguments Arguments, not including the program name
/// \param input Data written to the standard input of the process
///
/// \exception TransientError if the process cannot be started
auto runProcess(const std::string& program, const std::vector<std::string>& arguments, const std::string& input = {})
    -> ProcessResult;

#endif // BROOTFILE_PROCESS_HPP
