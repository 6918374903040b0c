#ifndef BROOTFILE_WORDLIST_HPP
#define BROOTFILE_WORDLIST_HPP

#include "types.hpp"

#include <atomic>
#include <fstream>
#include <mutex>
#include <optional>

/// \brief Lazy source of password candidates read from a newline-delimited file
///
/// A single sequential reader is shared by all workers. Claiming a candidate with next()
/// is mutually exclusive, so that each line is handed out exactly once and in file order.
///
/// Line terminators (LF or CRLF) are stripped and empty lines are skipped.
/// Duplicate lines are kept and handed out as many times as they appear.
class Wordlist
{
public:
    /// \brief Open the given file
    /// \exception FileError if the file cannot be opened
    explicit Wordlist(const std::string& filename);

    /// \brief Claim the next candidate
    /// \return the next candidate, or nothing if the end of the file is reached
    /// \exception FileError if reading the file fails
    auto next() -> std::optional<std::string>;

    /// Restart from the first line
    void rewind();

    /// \brief Discard the first \a count candidates
    /// \return the number of candidates actually discarded, less than \a count if the file is shorter
    /// \exception FileError if reading the file fails
    auto skip(std::uint64_t count) -> std::uint64_t;

    /// \return the number of candidates handed out by next() since the last rewind
    auto claimed() const -> std::uint64_t
    {
        return m_claimed;
    }

    /// \brief Estimate the number of candidates next() hands out in total
    ///
    /// The estimate extrapolates the average line length seen so far to the whole file.
    /// It is exact once the end of the file is reached, and 0 before anything is read.
    auto estimateTotal() const -> std::uint64_t;

private:
    auto readLine(std::string& line) -> bool; // requires m_mutex

    const std::string   m_filename;
    const std::uint64_t m_size;

    std::mutex    m_mutex;
    std::ifstream m_is;

    std::atomic<std::uint64_t> m_consumed = 0; // bytes read so far
    std::atomic<std::uint64_t> m_read     = 0; // candidates read so far, including skipped ones
    std::atomic<std::uint64_t> m_skipped  = 0;
    std::atomic<std::uint64_t> m_claimed  = 0;
    std::atomic<bool>          m_finished = false;
};

#endif // BROOTFILE_WORDLIST_HPP
