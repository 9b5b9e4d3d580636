/**
 *  @file       sampling_session.hpp
 *
 *  A sampling counter, its ring buffer and the lifecycle that ties them.
 */

#ifndef PIPA_COLLECTION_SAMPLING_SESSION_HPP_
#define PIPA_COLLECTION_SAMPLING_SESSION_HPP_

#include "pipa/collection/performance_counter.hpp"
#include "pipa/collection/ring_buffer_reader.hpp"
#include "pipa/core/errors.hpp"
#include "pipa/core/records.hpp"
#include "pipa/core/session_state.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <sys/types.h>

namespace pipa::collection
{

/**
 *  Configuration of a sampling session.
 */
struct SamplingConfig
{
    static constexpr std::size_t kDefaultDataPages = 8;

    /**
     *  Default sample payload: ip, pid/tid, time, cpu and period.
     */
    static constexpr std::uint64_t kDefaultSampleType = core::kSampleIp | core::kSampleTid |
                                                        core::kSampleTime | core::kSampleCpu |
                                                        core::kSamplePeriod;

    /**
     *  The sampling counter. sample_period must be non-zero.
     */
    CounterConfig counter;

    /**
     *  Power of two number of ring buffer data pages.
     */
    std::size_t data_pages{kDefaultDataPages};

    /**
     *  Builds a sampling configuration for a standard event.
     *
     *  @param      event   The event that triggers samples.
     *  @param      period  Events per sample, or Hz if use_frequency is set.
     *  @param      pid     Process/thread to monitor.
     *  @param      cpu     CPU to monitor.
     *  @return     A configuration with the default sample payload.
     */
    [[nodiscard]] static auto forEvent(StandardEvent event, std::uint64_t period,
                                       pid_t pid = core::kCallingThread,
                                       core::CpuTarget cpu = core::kAnyCpu) -> SamplingConfig;
};

/**
 *  Drives one sampling counter through its lifecycle:
 *
 *      create() -> arm() -> start() -> stop() -> drain() -> close()
 *
 *  Samples can be read with poll() or next() while running and while
 *  draining. Every operation is checked against core::checkTransition()
 *  and fails with PerfError::kInvalidState when out of order.
 *
 *  This class is move-only and not thread-safe; it is owned by a single
 *  collection thread.
 */
class SamplingSession
{
  public:
    /**
     *  Opens the sampling counter, disabled. The session starts in Created.
     *
     *  @param      config  The counter and buffer configuration.
     *  @return     A session, or PerfError on failure.
     */
    [[nodiscard]] static auto create(const SamplingConfig& config)
        -> std::expected<SamplingSession, core::PerfError>;

    /**
     *  Destroys the session. A session still running is stopped and
     *  drained first; samples read that way are discarded with a warning.
     */
    ~SamplingSession();

    SamplingSession(SamplingSession&& other) noexcept;
    auto operator=(SamplingSession&& other) noexcept -> SamplingSession&;

    // Non-copyable
    SamplingSession(const SamplingSession&) = delete;
    auto operator=(const SamplingSession&) -> SamplingSession& = delete;

    /**
     *  Maps the ring buffer. Created -> Armed.
     *
     *  @return     Success, PerfError::kInvalidState if not Created, or
     *              PerfError::kMappingFailed.
     */
    [[nodiscard]] auto arm() -> std::expected<void, core::PerfError>;

    /**
     *  Resets and enables the counter. Armed -> Running.
     */
    [[nodiscard]] auto start() -> std::expected<void, core::PerfError>;

    /**
     *  Reads the records currently available.
     *
     *  @param      max_records  Upper bound on records in the batch.
     *  @return     The batch, or PerfError::kInvalidState unless Running or
     *              Draining.
     */
    [[nodiscard]] auto poll(std::size_t max_records = RingBufferReader::kUnbounded)
        -> std::expected<PollBatch, core::PerfError>;

    /**
     *  Yields one record at a time.
     *
     *  @return     The next record, std::nullopt when nothing is available,
     *              or PerfError::kInvalidState unless Running or Draining.
     */
    [[nodiscard]] auto next() -> std::expected<std::optional<core::Record>, core::PerfError>;

    /**
     *  Disables the counter. Running -> Draining.
     */
    [[nodiscard]] auto stop() -> std::expected<void, core::PerfError>;

    /**
     *  Reads the buffer to exhaustion.
     *
     *  @return     Every remaining record, or PerfError::kInvalidState unless
     *              Draining.
     */
    [[nodiscard]] auto drain() -> std::expected<PollBatch, core::PerfError>;

    /**
     *  Releases the buffer and the counter. -> Closed.
     *
     *  From Draining the buffer is drained first and those records are
     *  returned. From Created or Armed no sample can exist and the batch is
     *  empty. Fails with PerfError::kInvalidState from Running or Closed.
     *
     *  @return     The records read while closing, or PerfError.
     */
    [[nodiscard]] auto close() -> std::expected<PollBatch, core::PerfError>;

    [[nodiscard]] auto state() const noexcept -> core::SessionState;

    /**
     *  Returns the period carried by the most recent sample.
     *
     *  With frequency-based sampling the kernel adapts the period, so this
     *  reflects the latest value rather than the configured one.
     *
     *  @return     The period, or std::nullopt before the first sample or if
     *              samples do not carry it.
     */
    [[nodiscard]] auto lastPeriod() const noexcept -> std::optional<std::uint64_t>;

    /**
     *  Returns the number of records the kernel reported as lost.
     */
    [[nodiscard]] auto lostCount() const noexcept -> std::uint64_t;

    /**
     *  Returns the reader totals, zero before arm().
     */
    [[nodiscard]] auto stats() const noexcept -> ReaderStats;

    [[nodiscard]] auto config() const noexcept -> const SamplingConfig&;

  private:
    SamplingSession(PerformanceCounter counter, SamplingConfig config) noexcept;

    auto transition(core::SessionState to) -> std::expected<void, core::PerfError>;
    void observe(const PollBatch& batch) noexcept;
    auto drainReader() -> PollBatch;
    void release() noexcept;

    PerformanceCounter counter_;
    SamplingConfig config_;
    std::optional<RingBufferReader> reader_;
    core::SessionState state_{core::SessionState::kCreated};
    std::optional<std::uint64_t> last_period_;
    ReaderStats final_stats_;
};

}  // namespace pipa::collection

#endif  // PIPA_COLLECTION_SAMPLING_SESSION_HPP_
