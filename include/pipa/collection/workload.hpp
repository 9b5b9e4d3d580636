/**
 *  @file       workload.hpp
 *
 *  A command run under measurement.
 *
 *  The child process is forked immediately but held at a gate until
 *  start(), so that counters can be attached to its pid before it runs.
 */

#ifndef PIPA_COLLECTION_WORKLOAD_HPP_
#define PIPA_COLLECTION_WORKLOAD_HPP_

#include "pipa/core/errors.hpp"

#include <csignal>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <sys/types.h>
#include <vector>

namespace pipa::collection
{

/**
 *  Lifecycle of a Workload.
 */
enum class WorkloadState : std::uint8_t
{
    /**
     *  Forked and waiting at the gate.
     */
    kSpawned = 0,

    /**
     *  Released and executing the command.
     */
    kRunning = 1,

    /**
     *  Reaped.
     */
    kExited = 2,
};

/**
 *  A forked child that executes a command once released.
 *
 *  Typical use pairs the pid with counters opened with enable_on_exec, so
 *  counting begins exactly when the command image starts.
 *
 *  This class is move-only; a child process has exactly one owner.
 *
 *  Example usage:
 *  @code
 *      std::array<std::string, 2> argv{"sleep", "1"};
 *      auto workload = Workload::spawn(argv);
 *      auto config = CounterConfig::forEvent(StandardEvent::kCycles, workload->pid());
 *      config.enable_on_exec = true;
 *      auto counter = PerformanceCounter::open(config);
 *      workload->start();
 *      auto status = workload->wait();
 *  @endcode
 */
class Workload
{
  public:
    /**
     *  Forks a child that will execute argv once started.
     *
     *  @param      argv  Command and arguments, looked up through PATH.
     *  @return     The workload, or WorkloadError on failure.
     */
    [[nodiscard]] static auto spawn(std::span<const std::string> argv)
        -> std::expected<Workload, core::WorkloadError>;

    /**
     *  Destroys the workload. A child still gated is released without
     *  executing; a running child is terminated. Either way it is reaped.
     */
    ~Workload();

    Workload(Workload&& other) noexcept;
    auto operator=(Workload&& other) noexcept -> Workload&;

    // Non-copyable
    Workload(const Workload&) = delete;
    auto operator=(const Workload&) -> Workload& = delete;

    /**
     *  Opens the gate and confirms the command was executed.
     *
     *  @return     Success, WorkloadError::kExecFailed if the command could
     *              not be executed or the child died at the gate, or
     *              kInvalidState unless Spawned.
     */
    [[nodiscard]] auto start() -> std::expected<void, core::WorkloadError>;

    /**
     *  Waits for the child to exit and reaps it.
     *
     *  @return     The exit code, or 128 + signal number if the child was
     *              killed by a signal; WorkloadError on failure.
     */
    [[nodiscard]] auto wait() -> std::expected<int, core::WorkloadError>;

    /**
     *  Sends a signal to the running child.
     *
     *  @param      signal  The signal number.
     *  @return     Success, or kInvalidState if the child is not running.
     */
    [[nodiscard]] auto kill(int signal = SIGTERM) const -> std::expected<void, core::WorkloadError>;

    [[nodiscard]] auto pid() const noexcept -> pid_t;
    [[nodiscard]] auto state() const noexcept -> WorkloadState;

    /**
     *  Returns the exit code recorded by wait(), or -1 before it.
     */
    [[nodiscard]] auto exitCode() const noexcept -> int;

  private:
    Workload(pid_t pid, int gate_fd, int error_fd, std::string command) noexcept;

    /**
     *  Blocks in waitpid() until the child is reaped.
     */
    auto reap() -> std::expected<int, core::WorkloadError>;

    /**
     *  Releases or terminates the child and reaps it.
     */
    void settle() noexcept;

    void closeFds() noexcept;

    static constexpr int kInvalidFd = -1;

    pid_t pid_;
    int gate_fd_;
    int error_fd_;
    std::string command_;
    WorkloadState state_{WorkloadState::kSpawned};
    int exit_code_{-1};
};

}  // namespace pipa::collection

#endif  // PIPA_COLLECTION_WORKLOAD_HPP_
