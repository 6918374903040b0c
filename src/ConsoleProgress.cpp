#include "ConsoleProgress.hpp"

ConsoleProgress::ConsoleProgress(std::ostream& os, const std::chrono::milliseconds& interval)
: Progress{os}
, m_interval{interval}
, m_in_destructor{false}
, m_printer{&ConsoleProgress::printerFunction, this}
{
}

ConsoleProgress::~ConsoleProgress()
{
    {
        const auto lock = std::scoped_lock{m_in_destructor_mutex};
        m_in_destructor = true;
    }

    m_in_destructor_cv.notify_all();
    m_printer.join();
}

void ConsoleProgress::printerFunction()
{
    auto repeat = true;
    {
        auto lock = std::unique_lock{m_in_destructor_mutex};
        repeat    = !m_in_destructor_cv.wait_for(lock, m_interval, [this] { return m_in_destructor; });
    }

    while (repeat)
    {
        log([snapshot = snapshot()](std::ostream& os) { os << snapshot << std::flush << "\033[1K\r"; });

        auto lock = std::unique_lock{m_in_destructor_mutex};
        repeat    = !m_in_destructor_cv.wait_for(lock, m_interval, [this] { return m_in_destructor; });
    }

    if (done)
        log([snapshot = snapshot()](std::ostream& os) { os << snapshot << std::endl; });
}

auto operator<<(std::ostream& os, const Progress::Snapshot& snapshot) -> std::ostream&
{
    const auto flagsBefore     = os.setf(std::ios::fixed, std::ios::floatfield);
    const auto precisionBefore = os.precision(1);

    const auto seconds = snapshot.elapsed.count();
    os << "Attempts: " << snapshot.attempts << " | Speed: " << (seconds > 0 ? snapshot.attempts / seconds : 0.0)
       << "/s | Elapsed: " << seconds << " s";
    if (snapshot.remaining)
        os << " | Remaining: ~" << *snapshot.remaining;

    os.precision(precisionBefore);
    os.flags(flagsBefore);

    return os;
}
