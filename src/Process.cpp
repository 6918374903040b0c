#include "Process.hpp"

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>

namespace
{

// Owner of a file descriptor
class FileDescriptor
{
public:
    FileDescriptor() = default;

    explicit FileDescriptor(int fd)
    : m_fd{fd}
    {
    }

    FileDescriptor(FileDescriptor&& other) noexcept
    : m_fd{other.release()}
    {
    }

    FileDescriptor(const FileDescriptor& other)            = delete;
    FileDescriptor& operator=(const FileDescriptor& other) = delete;

    ~FileDescriptor()
    {
        reset();
    }

    auto get() const -> int
    {
        return m_fd;
    }

    auto release() -> int
    {
        const auto fd = m_fd;
        m_fd          = -1;
        return fd;
    }

    void reset()
    {
        if (m_fd != -1)
            close(m_fd);
        m_fd = -1;
    }

private:
    int m_fd = -1;
};

auto makePipe() -> std::pair<FileDescriptor, FileDescriptor>
{
    auto fds = std::array<int, 2>{};
    if (pipe2(fds.data(), O_CLOEXEC) == -1)
        throw TransientError{std::string{"could not create a pipe: "} + std::strerror(errno)};
    return {FileDescriptor{fds[0]}, FileDescriptor{fds[1]}};
}

// Writing to a process which exited without reading its input must fail with EPIPE
// instead of terminating this process.
void ignoreSigpipe()
{
    static auto once = std::once_flag{};
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void writeAll(int fd, const std::string& data)
{
    auto written = std::size_t{};
    while (written < data.size())
    {
        const auto n = write(fd, data.data() + written, data.size() - written);
        if (n == -1)
        {
            if (errno == EINTR)
                continue;
            return; // EPIPE: the process does not read its input
        }
        written += n;
    }
}

auto readAll(int fd) -> std::string
{
    auto output = std::string{};
    auto buffer = std::array<char, 4096>{};
    for (;;)
    {
        const auto n = read(fd, buffer.data(), buffer.size());
        if (n == -1)
        {
            if (errno == EINTR)
                continue;
            break;
        }
        if (n == 0)
            break;

        // keep draining the pipe so that the process does not block on a full pipe
        const auto kept = std::min<std::size_t>(n, ProcessResult::maxOutputSize - output.size());
        output.append(buffer.data(), kept);
    }
    return output;
}

} // namespace

auto runProcess(const std::string& program, const std::vector<std::string>& arguments, const std::string& input)
    -> ProcessResult
{
    ignoreSigpipe();

    // prepare everything before forking, the child may only call async-signal-safe functions
    auto argv = std::vector<char*>{};
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& argument : arguments)
        argv.push_back(const_cast<char*>(argument.c_str()));
    argv.push_back(nullptr);

    auto [stdinRead, stdinWrite]   = makePipe();
    auto [outputRead, outputWrite] = makePipe();

    const auto pid = fork();
    if (pid == -1)
        throw TransientError{std::string{"could not start "} + program + ": " + std::strerror(errno)};

    if (pid == 0)
    {
        std::signal(SIGPIPE, SIG_DFL);
        dup2(stdinRead.get(), STDIN_FILENO);
        dup2(outputWrite.get(), STDOUT_FILENO);
        dup2(outputWrite.get(), STDERR_FILENO);
        execv(program.c_str(), argv.data());
        _exit(execFailureExitCode);
    }

    stdinRead.reset();
    outputWrite.reset();

    writeAll(stdinWrite.get(), input);
    stdinWrite.reset();

    auto result   = ProcessResult{};
    result.output = readAll(outputRead.get());

    auto status = 0;
    while (waitpid(pid, &status, 0) == -1)
        if (errno != EINTR)
            throw TransientError{std::string{"could not wait for "} + program + ": " + std::strerror(errno)};

    if (WIFSIGNALED(status))
    {
        result.exitCode = -1;
        result.signal   = WTERMSIG(status);
    }
    else
    {
        result.exitCode = WEXITSTATUS(status);
        result.signal   = 0;
    }

    return result;
}
