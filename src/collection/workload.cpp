/**
 *  @file       workload.cpp
 *
 *  Implementation of the gated child process.
 */

#include "pipa/collection/workload.hpp"

#include "pipa/core/errors.hpp"
#include "pipa/core/logging.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <expected>
#include <fcntl.h>
#include <span>
#include <string>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace pipa::collection
{

namespace
{

// Shell convention for "command could not be executed"
constexpr int kExecFailedExitCode = 127;

// Offset added to the signal number of a killed child
constexpr int kSignalExitBase = 128;

/**
 *  Closes a descriptor and marks it invalid.
 */
void closeFd(int& fd) noexcept
{
    if (fd >= 0)
    {
        ::close(fd);
        fd = -1;
    }
}

/**
 *  Child side: waits at the gate, then replaces itself with the command.
 *
 *  Runs between fork() and exec(), so it only uses async-signal-safe calls.
 */
[[noreturn]] void runChild(int gate_fd, int error_fd, char* const* argv) noexcept
{
    // Back to default dispositions for the command
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);

    char go = 0;
    ssize_t bytes = 0;
    do
    {
        bytes = ::read(gate_fd, &go, 1);
    } while (bytes < 0 && errno == EINTR);

    // Gate closed without a byte: the parent gave up on this workload
    if (bytes != 1)
    {
        _exit(0);
    }

    execvp(argv[0], argv);

    // Only reached if exec failed; the error pipe is closed on success
    int err = errno;
    ssize_t written = ::write(error_fd, &err, sizeof(err));
    (void)written;
    _exit(kExecFailedExitCode);
}

/**
 *  Translates a waitpid() status into an exit code.
 */
auto decodeStatus(int status) noexcept -> int
{
    if (WIFEXITED(status))
    {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status))
    {
        return kSignalExitBase + WTERMSIG(status);
    }
    return -1;
}

}  // namespace

Workload::Workload(pid_t pid, int gate_fd, int error_fd, std::string command) noexcept
    : pid_(pid), gate_fd_(gate_fd), error_fd_(error_fd), command_(std::move(command))
{
}

Workload::~Workload()
{
    settle();
}

void Workload::settle() noexcept
{
    if (pid_ <= 0 || state_ == WorkloadState::kExited)
    {
        closeFds();
        return;
    }

    if (state_ == WorkloadState::kRunning)
    {
        PIPA_LOG_WARNING("terminating workload '{}' (pid {})", command_, pid_);
        ::kill(pid_, SIGTERM);
    }

    // Closing the gate releases a child that never started
    closeFds();

    auto status = reap();
    if (!status)
    {
        PIPA_LOG_ERROR("failed to reap workload '{}' (pid {}): {}", command_, pid_,
                       core::toString(status.error()));
    }
}

Workload::Workload(Workload&& other) noexcept
    : pid_(std::exchange(other.pid_, -1)),
      gate_fd_(std::exchange(other.gate_fd_, kInvalidFd)),
      error_fd_(std::exchange(other.error_fd_, kInvalidFd)),
      command_(std::move(other.command_)),
      state_(std::exchange(other.state_, WorkloadState::kExited)),
      exit_code_(other.exit_code_)
{
}

auto Workload::operator=(Workload&& other) noexcept -> Workload&
{
    if (this != &other)
    {
        // Settle our own child before taking ownership
        settle();

        pid_ = std::exchange(other.pid_, -1);
        gate_fd_ = std::exchange(other.gate_fd_, kInvalidFd);
        error_fd_ = std::exchange(other.error_fd_, kInvalidFd);
        command_ = std::move(other.command_);
        state_ = std::exchange(other.state_, WorkloadState::kExited);
        exit_code_ = other.exit_code_;
    }
    return *this;
}

auto Workload::spawn(std::span<const std::string> argv)
    -> std::expected<Workload, core::WorkloadError>
{
    if (argv.empty() || argv.front().empty())
    {
        return std::unexpected(core::WorkloadError::kInvalidArguments);
    }

    // Build argv before fork(); the child must not allocate
    std::vector<std::string> storage(argv.begin(), argv.end());
    std::vector<char*> args;
    args.reserve(storage.size() + 1);
    for (auto& arg : storage)
    {
        args.push_back(arg.data());
    }
    args.push_back(nullptr);

    // Socket gate: start() sends with MSG_NOSIGNAL, so a dead child is EPIPE
    int gate[2];
    if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, gate) != 0)
    {
        return std::unexpected(core::WorkloadError::kPipeFailed);
    }

    int error[2];
    if (pipe2(error, O_CLOEXEC) != 0)
    {
        ::close(gate[0]);
        ::close(gate[1]);
        return std::unexpected(core::WorkloadError::kPipeFailed);
    }

    pid_t pid = fork();
    if (pid < 0)
    {
        int err = errno;
        PIPA_LOG_ERROR("fork failed for '{}': {}", storage.front(), std::strerror(err));
        ::close(gate[0]);
        ::close(gate[1]);
        ::close(error[0]);
        ::close(error[1]);
        return std::unexpected(core::WorkloadError::kForkFailed);
    }

    if (pid == 0)
    {
        // child
        ::close(gate[1]);
        ::close(error[0]);
        runChild(gate[0], error[1], args.data());
    }

    // parent
    ::close(gate[0]);
    ::close(error[1]);

    PIPA_LOG_DEBUG("spawned workload '{}' as pid {}", storage.front(), pid);
    return Workload{pid, gate[1], error[0], storage.front()};
}

auto Workload::start() -> std::expected<void, core::WorkloadError>
{
    if (state_ != WorkloadState::kSpawned || pid_ <= 0)
    {
        return std::unexpected(core::WorkloadError::kInvalidState);
    }

    char go = 1;
    ssize_t written = 0;
    do
    {
        written = ::send(gate_fd_, &go, 1, MSG_NOSIGNAL);
    } while (written < 0 && errno == EINTR);
    closeFd(gate_fd_);

    if (written != 1)
    {
        // The child is gone; collect it
        PIPA_LOG_ERROR("workload '{}' (pid {}) exited before start", command_, pid_);
        closeFd(error_fd_);
        auto status = reap();
        if (!status)
        {
            return std::unexpected(status.error());
        }
        return std::unexpected(core::WorkloadError::kExecFailed);
    }

    state_ = WorkloadState::kRunning;

    // EOF means exec succeeded and closed the pipe; data is the exec errno
    int exec_errno = 0;
    ssize_t bytes = 0;
    do
    {
        bytes = ::read(error_fd_, &exec_errno, sizeof(exec_errno));
    } while (bytes < 0 && errno == EINTR);
    closeFd(error_fd_);

    if (bytes > 0)
    {
        PIPA_LOG_ERROR("failed to execute '{}': {}", command_, std::strerror(exec_errno));
        auto status = reap();
        if (!status)
        {
            return std::unexpected(status.error());
        }
        return std::unexpected(core::WorkloadError::kExecFailed);
    }

    return {};
}

auto Workload::reap() -> std::expected<int, core::WorkloadError>
{
    int status = 0;
    while (waitpid(pid_, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            return std::unexpected(core::WorkloadError::kWaitFailed);
        }
    }

    exit_code_ = decodeStatus(status);
    state_ = WorkloadState::kExited;
    return exit_code_;
}

auto Workload::wait() -> std::expected<int, core::WorkloadError>
{
    if (state_ == WorkloadState::kExited)
    {
        return exit_code_;
    }

    if (state_ != WorkloadState::kRunning || pid_ <= 0)
    {
        return std::unexpected(core::WorkloadError::kInvalidState);
    }

    auto code = reap();
    if (code)
    {
        PIPA_LOG_DEBUG("workload '{}' exited with code {}", command_, *code);
    }
    return code;
}

auto Workload::kill(int signal) const -> std::expected<void, core::WorkloadError>
{
    if (state_ != WorkloadState::kRunning || pid_ <= 0)
    {
        return std::unexpected(core::WorkloadError::kInvalidState);
    }

    if (::kill(pid_, signal) != 0)
    {
        return std::unexpected(core::WorkloadError::kInvalidState);
    }

    return {};
}

void Workload::closeFds() noexcept
{
    closeFd(gate_fd_);
    closeFd(error_fd_);
}

auto Workload::pid() const noexcept -> pid_t
{
    return pid_;
}

auto Workload::state() const noexcept -> WorkloadState
{
    return state_;
}

auto Workload::exitCode() const noexcept -> int
{
    return exit_code_;
}

}  // namespace pipa::collection
