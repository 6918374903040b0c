#ifndef BROOTFILE_SIGINTHANDLER_HPP
#define BROOTFILE_SIGINTHANDLER_HPP

#include "Progress.hpp"

/// \brief Utility class to cancel a long operation when SIGINT arrives
///
/// The first SIGINT sets the progress state to Progress::State::Canceled, so that workers stop
/// claiming candidates and finish the validation in progress.
/// The default behavior is restored at the same time, so that a second SIGINT terminates the process
/// without waiting for a slow validation.
///
/// \note There should exist at most one instance of this class at any time.
class SigintHandler
{
public:
    /// Enable the signal handler
    explicit SigintHandler(std::atomic<Progress::State>& destination);

    /// Disable the signal handler
    ~SigintHandler();

    /// Deleted copy constructor
    SigintHandler(const SigintHandler& other) = delete;

    /// Deleted assignment operator
    SigintHandler& operator=(const SigintHandler& other) = delete;
};

#endif // BROOTFILE_SIGINTHANDLER_HPP
