#include "Wordlist.hpp"

#include "file.hpp"

#include <algorithm>

Wordlist::Wordlist(const std::string& filename)
: m_filename{filename}
, m_size{getFileSize(filename)}
, m_is{openInput(filename)}
{
}

auto Wordlist::next() -> std::optional<std::string>
{
    const auto lock = std::scoped_lock{m_mutex};

    auto line = std::string{};
    if (!readLine(line))
        return std::nullopt;

    m_claimed++;
    return line;
}

void Wordlist::rewind()
{
    const auto lock = std::scoped_lock{m_mutex};

    m_is.clear();
    m_is.seekg(0, std::ios::beg);
    if (!m_is)
        throw FileError{"could not rewind " + m_filename};

    m_consumed = 0;
    m_read     = 0;
    m_skipped  = 0;
    m_claimed  = 0;
    m_finished = false;
}

auto Wordlist::skip(std::uint64_t count) -> std::uint64_t
{
    const auto lock = std::scoped_lock{m_mutex};

    auto line    = std::string{};
    auto skipped = std::uint64_t{};
    while (skipped < count && readLine(line))
        skipped++;

    m_skipped += skipped;
    return skipped;
}

auto Wordlist::estimateTotal() const -> std::uint64_t
{
    const auto read    = m_read.load(std::memory_order_relaxed);
    const auto skipped = m_skipped.load(std::memory_order_relaxed);

    if (m_finished)
        return read - skipped;

    const auto consumed = m_consumed.load(std::memory_order_relaxed);
    if (!consumed || !read)
        return 0;

    const auto estimate = static_cast<std::uint64_t>(static_cast<double>(read) * m_size / consumed);
    return std::max(estimate, read) - skipped;
}

auto Wordlist::readLine(std::string& line) -> bool
{
    while (!m_finished)
    {
        if (!std::getline(m_is, line))
        {
            if (m_is.bad())
                throw FileError{"could not read " + m_filename};

            m_finished = true;
            break;
        }

        m_consumed += line.size() + 1;

        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        if (!line.empty())
        {
            m_read++;
            return true;
        }
    }

    return false;
}
