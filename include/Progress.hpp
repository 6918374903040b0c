#ifndef BROOTFILE_PROGRESS_HPP
#define BROOTFILE_PROGRESS_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <optional>

/// \brief Structure to report the progress of a dictionary attack or to cancel it
///
/// Workers update the counters with atomic operations only, so that reading
/// a snapshot never slows them down.
class Progress
{
public:
    /// Possible states of a long operation
    enum class State
    {
        Normal,   ///< The operation is ongoing or is fully completed
        Canceled, ///< The operation has been canceled externally
        EarlyExit ///< The operation stopped after a result was found
    };

    /// Point-in-time view of the progress
    struct Snapshot
    {
        std::uint64_t                 attempts;  ///< Validator invocations started so far
        std::chrono::duration<double> elapsed;   ///< Time since the progress object was created
        std::optional<std::uint64_t>  remaining; ///< Estimated number of candidates left, if known
    };

    /// Constructor
    explicit Progress(std::ostream& os);

    /// Get exclusive access to the shared output stream and output progress
    /// information with the given function
    template <typename F>
    void log(F f)
    {
        const auto lock = std::scoped_lock{m_os_mutex};
        f(m_os);
    }

    /// Read the counters without locking
    auto snapshot() const -> Snapshot;

    std::atomic<State>         state = State::Normal; ///< State of the long operation, the workers' stop flag
    std::atomic<std::uint64_t> done  = 0;             ///< Number of validator invocations started
    std::atomic<std::uint64_t> total = 0;             ///< Estimated total number of candidates, 0 if unknown

private:
    const std::chrono::steady_clock::time_point m_start;

    std::mutex    m_os_mutex;
    std::ostream& m_os;
};

#endif // BROOTFILE_PROGRESS_HPP
