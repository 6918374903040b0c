#ifndef BROOTFILE_DICTIONARYATTACK_HPP
#define BROOTFILE_DICTIONARYATTACK_HPP

#include "Progress.hpp"
#include "Validator.hpp"
#include "Wordlist.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <variant>

/// \file DictionaryAttack.hpp

/// A candidate unlocked the target
struct Found
{
    std::string   credential; ///< Candidate which unlocked the target
    std::uint64_t attempts;   ///< Validator invocations started during the run
};

/// Every candidate was tried without success
struct Exhausted
{
    std::uint64_t attempts; ///< Validator invocations started during the run
};

/// The run could not complete
struct Aborted
{
    std::string   reason;   ///< Description of the error which stopped the run
    std::uint64_t attempts; ///< Validator invocations started before stopping
};

/// Result of a dictionary attack
using Outcome = std::variant<Found, Exhausted, Aborted>;

/// \brief State shared by the workers of a dictionary attack
///
/// Progress::state is the stop flag and Progress::done the attempt counter.
/// The found credential is written at most once, by the first worker to succeed.
class DictionaryAttack
{
public:
    /// \brief Constructor
    /// \param wordlist Source of candidates, shared by all workers
    /// \param target File under attack
    /// \param validator Validator prepared for \a target
    /// \param progress Object to report progress and to cancel the attack
    DictionaryAttack(Wordlist& wordlist, const Target& target, const Validator& validator, Progress& progress);

    /// \brief Claim and try candidates until none remain, one succeeds or the progress state leaves Normal
    ///
    /// A transient error counts as a failed candidate.
    /// A structural error ends this worker only and is recorded.
    void work();

    /// \brief Build the outcome of the attack
    /// \param workers Number of workers which called work()
    /// \pre Every worker has returned from work()
    auto getOutcome(int workers) const -> Outcome;

private:
    void submit(const std::string& credential);

    Wordlist&        m_wordlist;
    const Target&    m_target;
    const Validator& m_validator;
    Progress&        m_progress;

    std::atomic<bool> m_transientReported = false;

    mutable std::mutex         m_mutex; // protects members below
    std::optional<std::string> m_credential;
    int                        m_failedWorkers = 0;
    std::string                m_failureReason;
};

/// \brief Try every candidate of the wordlist until one unlocks the target
///
/// With \a jobs less than or equal to 1, candidates are tried on the calling thread,
/// in file order. Otherwise exactly \a jobs threads claim candidates from the wordlist
/// and the first one to succeed provides the reported credential.
///
/// \param wordlist Source of candidates
/// \param target File under attack
/// \param validator Validator prepared for \a target
/// \param jobs Number of threads to use
/// \param progress Object to report progress, its state is also the stop flag
auto dictionaryAttack(Wordlist& wordlist, const Target& target, const Validator& validator, int jobs,
                      Progress& progress) -> Outcome;

#endif // BROOTFILE_DICTIONARYATTACK_HPP
