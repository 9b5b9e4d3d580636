/**
 *  @file       collector.cpp
 *
 *  Implementation of the background collection loop.
 */

#include "pipa/collection/collector.hpp"

#include "pipa/collection/counter_group.hpp"
#include "pipa/collection/proc_stat_source.hpp"
#include "pipa/collection/ring_buffer_reader.hpp"
#include "pipa/collection/sampling_session.hpp"
#include "pipa/core/errors.hpp"
#include "pipa/core/logging.hpp"
#include "pipa/core/session_state.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <expected>
#include <memory>
#include <optional>
#include <stop_token>
#include <string_view>
#include <thread>
#include <utility>

namespace pipa::collection
{

namespace
{

/**
 *  Hands data to a caller-supplied callback. An exception thrown by the
 *  callback is logged and the collection carries on.
 */
template <typename Callback, typename Value>
void invokeCallback(std::string_view what, const Callback& callback, const Value& value)
{
    try
    {
        callback(value);
    }
    catch (const std::exception& e)
    {
        PIPA_LOG_ERROR("{} callback threw: {}", what, e.what());
    }
}

}  // namespace

Collector::Collector(std::unique_ptr<Shared> shared) noexcept : shared_(std::move(shared)) {}

Collector::~Collector()
{
    // Ensure the collection thread is stopped and the session drained
    stop();
}

Collector::Collector(Collector&& other) noexcept
    : shared_(std::move(other.shared_)),
      collection_thread_(std::move(other.collection_thread_)),
      running_(other.running_.load())
{
    other.running_ = false;
}

auto Collector::operator=(Collector&& other) noexcept -> Collector&
{
    if (this != &other)
    {
        // Stop our current collection before taking ownership
        stop();

        shared_ = std::move(other.shared_);
        collection_thread_ = std::move(other.collection_thread_);
        running_ = other.running_.load();

        other.running_ = false;
    }
    return *this;
}

auto Collector::create(CollectorConfig config, CollectorSources sources)
    -> std::expected<Collector, core::PerfError>
{
    if (!sources.session && !sources.group && !sources.proc_stat)
    {
        return std::unexpected(core::PerfError::kInvalidConfig);
    }

    // Data from a source without a callback would be lost
    if ((sources.session && !sources.on_samples) || (sources.group && !sources.on_reading) ||
        (sources.proc_stat && !sources.on_proc_stat))
    {
        return std::unexpected(core::PerfError::kInvalidConfig);
    }

    if (sources.session && sources.session->state() != core::SessionState::kCreated &&
        sources.session->state() != core::SessionState::kArmed)
    {
        return std::unexpected(core::PerfError::kInvalidState);
    }

    if (sources.group && sources.group->state() != GroupState::kCreated)
    {
        return std::unexpected(core::PerfError::kInvalidState);
    }

    // Enforce minimum interval to prevent a busy loop
    if (config.poll_interval < CollectorConfig::kMinPollInterval)
    {
        config.poll_interval = CollectorConfig::kMinPollInterval;
    }

    if (config.max_records_per_poll == 0)
    {
        config.max_records_per_poll = CollectorConfig::kDefaultMaxRecordsPerPoll;
    }

    auto shared = std::make_unique<Shared>();
    shared->config = config;
    shared->sources = std::move(sources);

    return Collector{std::move(shared)};
}

auto Collector::start() -> std::expected<void, core::PerfError>
{
    if (!shared_ || running_.load(std::memory_order_acquire))
    {
        return std::unexpected(core::PerfError::kInvalidState);
    }

    auto& sources = shared_->sources;

    if (sources.session)
    {
        if (sources.session->state() == core::SessionState::kCreated)
        {
            auto armed = sources.session->arm();
            if (!armed)
            {
                return std::unexpected(armed.error());
            }
        }

        auto started = sources.session->start();
        if (!started)
        {
            return std::unexpected(started.error());
        }
    }

    if (sources.group)
    {
        auto reset_result = sources.group->reset();
        if (!reset_result)
        {
            return std::unexpected(reset_result.error());
        }

        auto started = sources.group->start();
        if (!started)
        {
            return std::unexpected(started.error());
        }
    }

    if (sources.proc_stat)
    {
        // Baseline for the first interval
        sources.proc_stat->reset();
    }

    // Reset counts for this run
    shared_->poll_count.store(0, std::memory_order_relaxed);
    shared_->samples_delivered.store(0, std::memory_order_relaxed);
    shared_->lost.store(0, std::memory_order_relaxed);

    // Mark as running before starting thread
    running_.store(true, std::memory_order_release);

    collection_thread_ = std::jthread(
        [shared = shared_.get()](const std::stop_token& stop_token)
        {
            collectionLoop(stop_token, *shared);
        });

    PIPA_LOG_DEBUG("collector started (interval {}ms)", shared_->config.poll_interval.count());
    return {};
}

void Collector::stop() noexcept
{
    if (!running_.load(std::memory_order_acquire))
    {
        return;
    }

    // Request thread to stop
    if (collection_thread_.joinable())
    {
        collection_thread_.request_stop();
        collection_thread_.join();
    }

    finish();

    running_.store(false, std::memory_order_release);
}

void Collector::finish()
{
    auto& sources = shared_->sources;

    if (sources.session && sources.session->state() == core::SessionState::kRunning)
    {
        auto stopped = sources.session->stop();
        if (!stopped)
        {
            PIPA_LOG_ERROR("failed to stop sampling session: {}",
                           core::toString(stopped.error()));
        }
    }

    if (sources.session && sources.session->state() == core::SessionState::kDraining)
    {
        auto drained = sources.session->drain();
        if (drained)
        {
            deliverSamples(*shared_, *drained);
        }

        auto closed = sources.session->close();
        if (closed)
        {
            deliverSamples(*shared_, *closed);
        }
        else
        {
            PIPA_LOG_ERROR("failed to close sampling session: {}", core::toString(closed.error()));
        }
    }

    if (sources.group && sources.group->state() == GroupState::kEnabled)
    {
        auto stopped = sources.group->stop();
        if (!stopped)
        {
            PIPA_LOG_ERROR("failed to stop counter group: {}", core::toString(stopped.error()));
        }

        // Final totals
        if (auto reading = sources.group->readAll())
        {
            invokeCallback("counter reading", sources.on_reading, *reading);
        }
    }

    if (sources.proc_stat)
    {
        if (auto sample = sources.proc_stat->poll())
        {
            invokeCallback("proc stat", sources.on_proc_stat, *sample);
        }
    }

    PIPA_LOG_DEBUG("collector stopped after {} polls, {} samples, {} lost",
                   shared_->poll_count.load(), shared_->samples_delivered.load(),
                   shared_->lost.load());
}

void Collector::collectionLoop(const std::stop_token& stop_token, Shared& shared)
{
    while (!stop_token.stop_requested())
    {
        pollOnce(shared);
        shared.poll_count.fetch_add(1, std::memory_order_relaxed);

        std::this_thread::sleep_for(shared.config.poll_interval);
    }
}

void Collector::pollOnce(Shared& shared)
{
    auto& sources = shared.sources;

    if (sources.session)
    {
        auto batch = sources.session->poll(shared.config.max_records_per_poll);
        if (batch)
        {
            deliverSamples(shared, *batch);
        }
        else
        {
            PIPA_LOG_ERROR("sample poll failed: {}", core::toString(batch.error()));
        }
    }

    if (sources.group)
    {
        auto reading = sources.group->readAll();
        if (reading)
        {
            invokeCallback("counter reading", sources.on_reading, *reading);
        }
        else
        {
            PIPA_LOG_WARNING("counter group read failed: {}", core::toString(reading.error()));
        }
    }

    if (sources.proc_stat)
    {
        auto sample = sources.proc_stat->poll();
        if (sample)
        {
            invokeCallback("proc stat", sources.on_proc_stat, *sample);
        }
        else
        {
            PIPA_LOG_WARNING("proc stat poll failed: {}", core::toString(sample.error()));
        }
    }
}

void Collector::deliverSamples(Shared& shared, const PollBatch& batch)
{
    shared.samples_delivered.fetch_add(batch.samples.size(), std::memory_order_relaxed);
    shared.lost.fetch_add(batch.lost, std::memory_order_relaxed);

    if (!batch.samples.empty() || !batch.events.empty())
    {
        invokeCallback("sample batch", shared.sources.on_samples, batch);
    }
}

auto Collector::isRunning() const noexcept -> bool
{
    return running_.load(std::memory_order_acquire);
}

auto Collector::pollCount() const noexcept -> std::uint64_t
{
    return shared_ ? shared_->poll_count.load(std::memory_order_relaxed) : 0;
}

auto Collector::samplesDelivered() const noexcept -> std::uint64_t
{
    return shared_ ? shared_->samples_delivered.load(std::memory_order_relaxed) : 0;
}

auto Collector::lostCount() const noexcept -> std::uint64_t
{
    return shared_ ? shared_->lost.load(std::memory_order_relaxed) : 0;
}

auto Collector::sessionState() const noexcept -> std::optional<core::SessionState>
{
    if (!shared_ || !shared_->sources.session)
    {
        return std::nullopt;
    }
    return shared_->sources.session->state();
}

auto Collector::pollInterval() const noexcept -> std::chrono::milliseconds
{
    return shared_ ? shared_->config.poll_interval : CollectorConfig::kDefaultPollInterval;
}

}  // namespace pipa::collection
