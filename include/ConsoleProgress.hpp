#ifndef BROOTFILE_CONSOLEPROGRESS_HPP
#define BROOTFILE_CONSOLEPROGRESS_HPP

#include <condition_variable>
#include <mutex>
#include <thread>

#include "Progress.hpp"

/// Progress indicator which prints a snapshot at regular time intervals
class ConsoleProgress : public Progress
{
public:
    /// Start a thread to print progress
    ConsoleProgress(std::ostream& os, const std::chrono::milliseconds& interval = std::chrono::milliseconds(200));

    /// Notify and stop the printing thread
    ~ConsoleProgress();

private:
    const std::chrono::milliseconds m_interval;

    std::mutex              m_in_destructor_mutex;
    std::condition_variable m_in_destructor_cv;
    bool                    m_in_destructor;

    std::thread m_printer;
    void        printerFunction();
};

/// Insert a one-line human readable representation of a progress snapshot into the stream \a os
auto operator<<(std::ostream& os, const Progress::Snapshot& snapshot) -> std::ostream&;

#endif // BROOTFILE_CONSOLEPROGRESS_HPP
