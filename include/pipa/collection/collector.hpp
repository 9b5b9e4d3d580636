/**
 *  @file       collector.hpp
 *
 *  Background collection of samples, counter readings and system
 *  statistics while a workload runs.
 *
 *  A Collector owns its sources and polls them from a dedicated thread at
 *  a fixed interval. Stopping it always drains the sampling buffer before
 *  the session is closed, so the final batch is delivered.
 */

#ifndef PIPA_COLLECTION_COLLECTOR_HPP_
#define PIPA_COLLECTION_COLLECTOR_HPP_

#include "pipa/collection/counter_group.hpp"
#include "pipa/collection/proc_stat_source.hpp"
#include "pipa/collection/ring_buffer_reader.hpp"
#include "pipa/collection/sampling_session.hpp"
#include "pipa/core/errors.hpp"
#include "pipa/core/session_state.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <thread>

namespace pipa::collection
{

/**
 *  Timing and batching of a Collector.
 */
struct CollectorConfig
{
    /**
     *  Default time between polls (10 milliseconds).
     */
    static constexpr auto kDefaultPollInterval = std::chrono::milliseconds(10);

    /**
     *  Minimum allowed poll interval (1 millisecond). Shorter intervals
     *  are clamped.
     */
    static constexpr auto kMinPollInterval = std::chrono::milliseconds(1);

    static constexpr std::size_t kDefaultMaxRecordsPerPoll = 4096;

    std::chrono::milliseconds poll_interval{kDefaultPollInterval};

    /**
     *  Upper bound on records taken from the buffer per poll. The final
     *  drain is not bounded.
     */
    std::size_t max_records_per_poll{kDefaultMaxRecordsPerPoll};
};

/**
 *  Sources a Collector takes ownership of, and where their data goes.
 *
 *  Callbacks are invoked from the collection thread while running, and
 *  from the thread calling stop() for the final delivery. A source without
 *  a callback is rejected. A std::exception thrown by a callback is logged
 *  and does not stop collection.
 */
struct CollectorSources
{
    using SampleBatchCallback = std::function<void(const PollBatch&)>;
    using GroupReadingCallback = std::function<void(const std::map<std::uint64_t, ScaledValue>&)>;
    using ProcStatCallback = std::function<void(const ProcStatSample&)>;

    /**
     *  A session in Created or Armed state.
     */
    std::optional<SamplingSession> session;
    SampleBatchCallback on_samples;

    /**
     *  A counter group that has not been started.
     */
    std::optional<CounterGroup> group;
    GroupReadingCallback on_reading;

    std::optional<ProcStatSource> proc_stat;
    ProcStatCallback on_proc_stat;
};

/**
 *  Runs the collection loop for one monitored target.
 *
 *  The loop never blocks indefinitely: each poll is bounded by the data
 *  available at that moment, and the thread sleeps for the poll interval
 *  between polls.
 *
 *  This class is move-only; the collection thread cannot be copied.
 *
 *  Example usage:
 *  @code
 *      CollectorSources sources;
 *      sources.session = std::move(*session);
 *      sources.on_samples = [&store](const PollBatch& batch) { store.add(batch); };
 *      auto collector = Collector::create({}, std::move(sources));
 *      collector->start();
 *      // ... workload runs ...
 *      collector->stop();
 *  @endcode
 */
class Collector
{
  public:
    /**
     *  Creates a collector that owns the given sources.
     *
     *  @param      config   Timing and batching; the interval is clamped.
     *  @param      sources  At least one source, each with its callback.
     *  @return     A Collector, or PerfError::kInvalidConfig if there is no
     *              source or a source lacks a callback, or
     *              PerfError::kInvalidState if the session is past Armed.
     */
    [[nodiscard]] static auto create(CollectorConfig config, CollectorSources sources)
        -> std::expected<Collector, core::PerfError>;

    /**
     *  Destroys the collector, stopping it if running.
     *
     *  Blocks until the collection thread has terminated and the final
     *  batch has been delivered.
     */
    ~Collector();

    Collector(Collector&& other) noexcept;
    auto operator=(Collector&& other) noexcept -> Collector&;

    // Non-copyable
    Collector(const Collector&) = delete;
    auto operator=(const Collector&) -> Collector& = delete;

    /**
     *  Arms and starts the sources and launches the collection thread.
     *
     *  @return     Success, or PerfError if already started or a source
     *              fails to start.
     */
    [[nodiscard]] auto start() -> std::expected<void, core::PerfError>;

    /**
     *  Stops collection.
     *
     *  Signals the thread to stop and joins it, then moves the session
     *  through Draining to Closed, delivering every remaining record, and
     *  delivers a final counter reading. A no-op unless running.
     */
    void stop() noexcept;

    [[nodiscard]] auto isRunning() const noexcept -> bool;

    /**
     *  Returns the number of completed poll cycles.
     */
    [[nodiscard]] auto pollCount() const noexcept -> std::uint64_t;

    /**
     *  Returns the number of samples delivered, including the final drain.
     */
    [[nodiscard]] auto samplesDelivered() const noexcept -> std::uint64_t;

    /**
     *  Returns the number of records the kernel reported as lost.
     */
    [[nodiscard]] auto lostCount() const noexcept -> std::uint64_t;

    /**
     *  Returns the session state, or std::nullopt without a session.
     */
    [[nodiscard]] auto sessionState() const noexcept -> std::optional<core::SessionState>;

    [[nodiscard]] auto pollInterval() const noexcept -> std::chrono::milliseconds;

  private:
    /**
     *  State shared with the collection thread. Heap allocated so that its
     *  address survives moves of the Collector.
     */
    struct Shared
    {
        CollectorConfig config;
        CollectorSources sources;
        std::atomic<std::uint64_t> poll_count{0};
        std::atomic<std::uint64_t> samples_delivered{0};
        std::atomic<std::uint64_t> lost{0};
    };

    explicit Collector(std::unique_ptr<Shared> shared) noexcept;

    /**
     *  Collection thread entry point.
     *
     *  @param      stop_token  Token for cooperative cancellation.
     *  @param      shared      Sources and counters.
     */
    static void collectionLoop(const std::stop_token& stop_token, Shared& shared);

    /**
     *  Polls every source once.
     */
    static void pollOnce(Shared& shared);

    static void deliverSamples(Shared& shared, const PollBatch& batch);

    /**
     *  Runs the mandatory Running -> Draining -> Closed sequence.
     */
    void finish();

    std::unique_ptr<Shared> shared_;
    std::jthread collection_thread_;
    std::atomic<bool> running_{false};
};

}  // namespace pipa::collection

#endif  // PIPA_COLLECTION_COLLECTOR_HPP_
