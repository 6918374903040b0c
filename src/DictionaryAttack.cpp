#include "DictionaryAttack.hpp"

#include "log.hpp"

#include <algorithm>
#include <thread>

DictionaryAttack::DictionaryAttack(Wordlist& wordlist, const Target& target, const Validator& validator,
                                   Progress& progress)
: m_wordlist{wordlist}
, m_target{target}
, m_validator{validator}
, m_progress{progress}
{
}

void DictionaryAttack::work()
{
    try
    {
        while (m_progress.state == Progress::State::Normal)
        {
            const auto candidate = m_wordlist.next();
            m_progress.total     = m_wordlist.estimateTotal();
            if (!candidate)
                break;

            m_progress.done++;

            auto success = false;
            try
            {
                success = m_validator.attempt(*candidate, m_target);
            }
            catch (const TransientError& e)
            {
                if (!m_transientReported.exchange(true))
                    m_progress.log(
                        [&e](std::ostream& os)
                        {
                            os << "[" << put_time << "] " << e.what() << "\n"
                               << "Attempts failing this way count as wrong candidates and are not reported again."
                               << std::endl;
                        });
            }

            if (success)
            {
                submit(*candidate);
                break;
            }
        }
    }
    catch (const BaseError& e) // structural error from the validator or read error from the wordlist
    {
        const auto lock = std::scoped_lock{m_mutex};
        m_failedWorkers++;
        if (m_failureReason.empty())
            m_failureReason = e.what();
    }
}

void DictionaryAttack::submit(const std::string& credential)
{
    {
        const auto lock = std::scoped_lock{m_mutex};
        if (!m_credential)
            m_credential = credential;
    }

    auto expected = Progress::State::Normal;
    m_progress.state.compare_exchange_strong(expected, Progress::State::EarlyExit);
}

auto DictionaryAttack::getOutcome(int workers) const -> Outcome
{
    const auto lock     = std::scoped_lock{m_mutex};
    const auto attempts = m_progress.done.load();

    if (m_credential)
        return Found{*m_credential, attempts};
    if (m_failedWorkers == workers)
        return Aborted{m_failureReason, attempts};
    if (m_progress.state == Progress::State::Canceled)
        return Aborted{"interrupted by user", attempts};

    return Exhausted{attempts};
}

auto dictionaryAttack(Wordlist& wordlist, const Target& target, const Validator& validator, int jobs,
                      Progress& progress) -> Outcome
{
    auto attack = DictionaryAttack{wordlist, target, validator, progress};

    const auto workers = std::max(jobs, 1);
    if (workers == 1)
        attack.work();
    else
    {
        auto threads = std::vector<std::thread>{};
        for (auto i = 0; i < workers; ++i)
            threads.emplace_back([&attack] { attack.work(); });
        for (auto& thread : threads)
            thread.join();
    }

    return attack.getOutcome(workers);
}
