#include "Progress.hpp"

Progress::Progress(std::ostream& os)
: m_start{std::chrono::steady_clock::now()}
, m_os{os}
{
}

auto Progress::snapshot() const -> Snapshot
{
    const auto attempts = done.load(std::memory_order_relaxed);
    const auto estimate = total.load(std::memory_order_relaxed);

    auto remaining = std::optional<std::uint64_t>{};
    if (estimate)
        remaining = estimate > attempts ? estimate - attempts : 0;

    return {attempts, std::chrono::steady_clock::now() - m_start, remaining};
}
