//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements subprocess spawning, output pumping, and cancellation.
///
//===----------------------------------------------------------------------===//

#include "tryrun/Support/Process.h"

#include "tryrun/Support/Error.h"

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace tryrun
{
namespace
{

constexpr int PollIntervalMillis = 10;

/// @brief Closes a descriptor exactly once.
class FileDescriptor final
{
public:
    FileDescriptor() = default;
    explicit FileDescriptor(const int fd)
        : fd_(fd)
    {
    }
    ~FileDescriptor()
    {
        reset();
    }

    FileDescriptor(const FileDescriptor&)            = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    [[nodiscard]] int get() const
    {
        return fd_;
    }

    [[nodiscard]] bool valid() const
    {
        return fd_ >= 0;
    }

    void reset(const int fd = -1)
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_{-1};
};

// Both ends are close-on-exec: other workers spawn concurrently and must not
// inherit this child's pipes. `adddup2` clears the flag on the target.
bool makePipe(FileDescriptor& readEnd, FileDescriptor& writeEnd)
{
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0)
    {
        return false;
    }
    readEnd.reset(fds[0]);
    writeEnd.reset(fds[1]);
    ::fcntl(readEnd.get(), F_SETFL, ::fcntl(readEnd.get(), F_GETFL) | O_NONBLOCK);
    return true;
}

/// @brief Reads whatever is available; closes the descriptor on EOF.
void drain(FileDescriptor& fd, const ProcessOutputFn& sink)
{
    std::array<char, 4096> buffer{};
    while (fd.valid())
    {
        const ssize_t n = ::read(fd.get(), buffer.data(), buffer.size());
        if (n > 0)
        {
            if (sink)
            {
                sink(llvm::StringRef(buffer.data(), static_cast<std::size_t>(n)));
            }
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
        {
            return;
        }
        if (n < 0 && errno == EINTR)
        {
            continue;
        }
        fd.reset();
    }
}

ProcessExit decodeStatus(const int status)
{
    ProcessExit exit;
    if (WIFEXITED(status))
    {
        exit.exitCode = WEXITSTATUS(status);
    }
    else if (WIFSIGNALED(status))
    {
        exit.signal   = WTERMSIG(status);
        exit.exitCode = 128 + WTERMSIG(status);
    }
    return exit;
}

}  // namespace

llvm::Expected<ProcessExit> runProcess(const ProcessSpec&        spec,
                                       const ProcessOutputFn&    onStdout,
                                       const ProcessOutputFn&    onStderr,
                                       const CancellationToken& token)
{
    if (spec.argv.empty())
    {
        return makePipelineError(ErrorKind::ToolchainFailure, "empty command line");
    }

    FileDescriptor stdoutRead;
    FileDescriptor stdoutWrite;
    FileDescriptor stderrRead;
    FileDescriptor stderrWrite;
    if (!makePipe(stdoutRead, stdoutWrite) || !makePipe(stderrRead, stderrWrite))
    {
        return makePipelineError(ErrorKind::ToolchainFailure,
                                 llvm::Twine("failed to create pipes: ") + std::strerror(errno));
    }

    std::vector<char*> cargs;
    cargs.reserve(spec.argv.size() + 1);
    for (const auto& a : spec.argv)
    {
        cargs.push_back(const_cast<char*>(a.c_str()));
    }
    cargs.push_back(nullptr);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, spec.stdinPath.c_str(), O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, stdoutWrite.get(), STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrWrite.get(), STDERR_FILENO);

    posix_spawnattr_t attributes;
    posix_spawnattr_init(&attributes);
    posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&attributes, 0);

    pid_t     pid = -1;
    const int sp  = ::posix_spawnp(&pid, cargs[0], &actions, &attributes, cargs.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attributes);
    stdoutWrite.reset();
    stderrWrite.reset();

    if (sp != 0)
    {
        return makePipelineError(ErrorKind::ToolchainFailure,
                                 llvm::Twine("failed to launch '") + spec.argv.front() + "': " + std::strerror(sp));
    }

    bool killed = false;
    int  status = 0;
    bool reaped = false;
    while (!reaped)
    {
        if (!killed && token.isCancellationRequested())
        {
            ::kill(-pid, SIGKILL);
            killed = true;
        }

        std::array<pollfd, 2> fds{};
        nfds_t                count = 0;
        if (stdoutRead.valid())
        {
            fds[count++] = pollfd{stdoutRead.get(), POLLIN, 0};
        }
        if (stderrRead.valid())
        {
            fds[count++] = pollfd{stderrRead.get(), POLLIN, 0};
        }

        if (count > 0)
        {
            ::poll(fds.data(), count, PollIntervalMillis);
            drain(stdoutRead, onStdout);
            drain(stderrRead, onStderr);
        }
        else
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(PollIntervalMillis));
        }

        const pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid)
        {
            reaped = true;
        }
        else if (waited < 0 && errno != EINTR)
        {
            return makePipelineError(ErrorKind::ToolchainFailure,
                                     llvm::Twine("waitpid failed: ") + std::strerror(errno));
        }
    }

    // Collect anything written between the last poll and exit.
    drain(stdoutRead, onStdout);
    drain(stderrRead, onStderr);

    ProcessExit exit = decodeStatus(status);
    exit.killed      = killed;
    return exit;
}

llvm::Expected<ProcessExit> runProcessCapture(const ProcessSpec&        spec,
                                              std::string&              combinedOutput,
                                              const CancellationToken& token)
{
    combinedOutput.clear();
    const auto append = [&combinedOutput](const llvm::StringRef chunk) {
        combinedOutput.append(chunk.data(), chunk.size());
    };
    return runProcess(spec, append, append, token);
}

}  // namespace tryrun
