/**
 *  @file       sampling_session.cpp
 *
 *  Implementation of the sampling session state machine.
 */

#include "pipa/collection/sampling_session.hpp"

#include "pipa/collection/mapped_region.hpp"
#include "pipa/collection/performance_counter.hpp"
#include "pipa/collection/ring_buffer_reader.hpp"
#include "pipa/core/errors.hpp"
#include "pipa/core/logging.hpp"
#include "pipa/core/records.hpp"
#include "pipa/core/session_state.hpp"

#include <bit>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <iterator>
#include <optional>
#include <utility>
#include <variant>

namespace pipa::collection
{

namespace
{

/**
 *  Appends the records of one batch to another.
 */
void appendBatch(PollBatch& into, PollBatch&& from)
{
    into.samples.insert(into.samples.end(), std::make_move_iterator(from.samples.begin()),
                        std::make_move_iterator(from.samples.end()));
    into.events.insert(into.events.end(), std::make_move_iterator(from.events.begin()),
                       std::make_move_iterator(from.events.end()));
    into.lost += from.lost;
    into.incomplete = from.incomplete;
}

}  // namespace

auto SamplingConfig::forEvent(StandardEvent event, std::uint64_t period, pid_t pid,
                              core::CpuTarget cpu) -> SamplingConfig
{
    SamplingConfig config{};
    config.counter = CounterConfig::forEvent(event, pid, cpu);
    config.counter.sample_period = period;
    config.counter.sample_type = kDefaultSampleType;
    config.counter.wakeup_events = 1;
    return config;
}

SamplingSession::SamplingSession(PerformanceCounter counter, SamplingConfig config) noexcept
    : counter_(std::move(counter)), config_(std::move(config))
{
}

SamplingSession::~SamplingSession()
{
    if (state_ == core::SessionState::kRunning)
    {
        PIPA_LOG_WARNING("sampling session '{}' destroyed while running",
                         config_.counter.label);
        auto disabled = counter_.disable();
        if (!disabled)
        {
            PIPA_LOG_ERROR("failed to disable '{}': {}", config_.counter.label,
                           core::toString(disabled.error()));
        }
        state_ = core::SessionState::kDraining;
    }

    if (state_ == core::SessionState::kDraining && reader_)
    {
        auto batch = drainReader();
        if (!batch.samples.empty())
        {
            PIPA_LOG_WARNING("discarding {} undelivered samples of '{}'", batch.samples.size(),
                             config_.counter.label);
        }
    }

    release();
}

SamplingSession::SamplingSession(SamplingSession&& other) noexcept
    : counter_(std::move(other.counter_)),
      config_(std::move(other.config_)),
      reader_(std::move(other.reader_)),
      state_(std::exchange(other.state_, core::SessionState::kClosed)),
      last_period_(std::exchange(other.last_period_, std::nullopt)),
      final_stats_(other.final_stats_)
{
    other.reader_.reset();
}

auto SamplingSession::operator=(SamplingSession&& other) noexcept -> SamplingSession&
{
    if (this != &other)
    {
        release();

        counter_ = std::move(other.counter_);
        config_ = std::move(other.config_);
        reader_ = std::move(other.reader_);
        other.reader_.reset();
        state_ = std::exchange(other.state_, core::SessionState::kClosed);
        last_period_ = std::exchange(other.last_period_, std::nullopt);
        final_stats_ = other.final_stats_;
    }
    return *this;
}

auto SamplingSession::create(const SamplingConfig& config)
    -> std::expected<SamplingSession, core::PerfError>
{
    // A sampling session without a period would never produce a record
    if (config.counter.sample_period == 0)
    {
        return std::unexpected(core::PerfError::kInvalidConfig);
    }

    if (!std::has_single_bit(config.data_pages) ||
        config.data_pages > MappedRegion::kMaxDataPages)
    {
        return std::unexpected(core::PerfError::kInvalidConfig);
    }

    auto counter = PerformanceCounter::open(config.counter);
    if (!counter)
    {
        return std::unexpected(counter.error());
    }

    PIPA_LOG_DEBUG("sampling session '{}' created (period {}{})", config.counter.label,
                   config.counter.sample_period, config.counter.use_frequency ? " Hz" : "");

    return SamplingSession{std::move(*counter), config};
}

auto SamplingSession::transition(core::SessionState to) -> std::expected<void, core::PerfError>
{
    auto allowed = core::checkTransition(state_, to);
    if (!allowed)
    {
        PIPA_LOG_DEBUG("rejected transition {} -> {} for '{}'", core::toString(state_),
                       core::toString(to), config_.counter.label);
        return allowed;
    }

    PIPA_LOG_DEBUG("sampling session '{}': {} -> {}", config_.counter.label,
                   core::toString(state_), core::toString(to));
    state_ = to;
    return {};
}

auto SamplingSession::arm() -> std::expected<void, core::PerfError>
{
    if (auto allowed = core::checkTransition(state_, core::SessionState::kArmed); !allowed)
    {
        return allowed;
    }

    auto reader = RingBufferReader::map(counter_.fileDescriptor(), config_.data_pages,
                                        core::SampleLayout{
                                            .sample_type = config_.counter.sample_type,
                                            .read_format = config_.counter.read_format |
                                                           core::kFormatTotalTimeEnabled |
                                                           core::kFormatTotalTimeRunning,
                                        });
    if (!reader)
    {
        return std::unexpected(reader.error());
    }

    reader_.emplace(std::move(*reader));
    return transition(core::SessionState::kArmed);
}

auto SamplingSession::start() -> std::expected<void, core::PerfError>
{
    if (auto allowed = core::checkTransition(state_, core::SessionState::kRunning); !allowed)
    {
        return allowed;
    }

    auto reset_result = counter_.reset();
    if (!reset_result)
    {
        return std::unexpected(reset_result.error());
    }

    auto enable_result = counter_.enable();
    if (!enable_result)
    {
        return std::unexpected(enable_result.error());
    }

    return transition(core::SessionState::kRunning);
}

auto SamplingSession::poll(std::size_t max_records) -> std::expected<PollBatch, core::PerfError>
{
    if (!core::canReadSamples(state_) || !reader_)
    {
        return std::unexpected(core::PerfError::kInvalidState);
    }

    auto batch = reader_->poll(max_records);
    observe(batch);
    return batch;
}

auto SamplingSession::next() -> std::expected<std::optional<core::Record>, core::PerfError>
{
    if (!core::canReadSamples(state_) || !reader_)
    {
        return std::unexpected(core::PerfError::kInvalidState);
    }

    auto record = reader_->next();
    if (!record)
    {
        // Current snapshot exhausted; look for newer data once
        reader_->beginPoll();
        record = reader_->next();
    }

    if (record)
    {
        if (const auto* sample = std::get_if<core::SampleRecord>(&*record);
            sample != nullptr && sample->period)
        {
            last_period_ = sample->period;
        }
    }
    return record;
}

auto SamplingSession::stop() -> std::expected<void, core::PerfError>
{
    if (auto allowed = core::checkTransition(state_, core::SessionState::kDraining); !allowed)
    {
        return allowed;
    }

    auto disable_result = counter_.disable();
    if (!disable_result)
    {
        return std::unexpected(disable_result.error());
    }

    return transition(core::SessionState::kDraining);
}

auto SamplingSession::drainReader() -> PollBatch
{
    PollBatch all;
    if (!reader_)
    {
        return all;
    }

    // Each poll is bounded by the head snapshot; stop once one makes no
    // progress so a stuck incomplete record cannot spin forever
    while (true)
    {
        auto before = reader_->stats();
        auto batch = reader_->poll();
        auto after = reader_->stats();

        bool progressed = after.records_read != before.records_read ||
                          after.corrupt != before.corrupt;
        appendBatch(all, std::move(batch));

        if (!progressed || !reader_->hasUnread())
        {
            break;
        }
    }

    observe(all);
    return all;
}

auto SamplingSession::drain() -> std::expected<PollBatch, core::PerfError>
{
    if (state_ != core::SessionState::kDraining)
    {
        return std::unexpected(core::PerfError::kInvalidState);
    }

    auto batch = drainReader();
    PIPA_LOG_DEBUG("drained {} samples from '{}'", batch.samples.size(), config_.counter.label);
    return batch;
}

auto SamplingSession::close() -> std::expected<PollBatch, core::PerfError>
{
    if (auto allowed = core::checkTransition(state_, core::SessionState::kClosed); !allowed)
    {
        return std::unexpected(allowed.error());
    }

    PollBatch remaining;
    if (state_ == core::SessionState::kDraining)
    {
        remaining = drainReader();
    }

    release();

    if (auto moved = transition(core::SessionState::kClosed); !moved)
    {
        return std::unexpected(moved.error());
    }
    return remaining;
}

void SamplingSession::observe(const PollBatch& batch) noexcept
{
    // Samples are in buffer order, so the last one carrying a period wins
    for (auto it = batch.samples.rbegin(); it != batch.samples.rend(); ++it)
    {
        if (it->period)
        {
            last_period_ = it->period;
            break;
        }
    }
}

void SamplingSession::release() noexcept
{
    if (reader_)
    {
        final_stats_ = reader_->stats();
        reader_.reset();
    }
    counter_.close();
}

auto SamplingSession::state() const noexcept -> core::SessionState
{
    return state_;
}

auto SamplingSession::lastPeriod() const noexcept -> std::optional<std::uint64_t>
{
    return last_period_;
}

auto SamplingSession::lostCount() const noexcept -> std::uint64_t
{
    return stats().lost;
}

auto SamplingSession::stats() const noexcept -> ReaderStats
{
    return reader_ ? reader_->stats() : final_stats_;
}

auto SamplingSession::config() const noexcept -> const SamplingConfig&
{
    return config_;
}

}  // namespace pipa::collection
