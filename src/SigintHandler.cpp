#include "SigintHandler.hpp"

#include <csignal>

namespace
{

static_assert(std::atomic<Progress::State>::is_always_lock_free, "atomics must be lock-free to be signal-safe");

std::atomic<Progress::State>* destination = nullptr;

void cancelOnSigint(int sig)
{
    auto expected = Progress::State::Normal;
    destination->compare_exchange_strong(expected, Progress::State::Canceled);
    std::signal(sig, SIG_DFL);
}

} // namespace

SigintHandler::SigintHandler(std::atomic<Progress::State>& destination)
{
    ::destination = &destination;
    std::signal(SIGINT, &cancelOnSigint);
}

SigintHandler::~SigintHandler()
{
    std::signal(SIGINT, SIG_DFL);
    destination = nullptr;
}
