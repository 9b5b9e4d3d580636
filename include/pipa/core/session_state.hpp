/**
 *  @file       session_state.hpp
 *
 *  Lifecycle states of a sampling session and the rules between them.
 *
 *  A session only ever moves forward:
 *
 *      Created -> Armed -> Running -> Draining -> Closed
 *
 *  Running must pass through Draining so that the final batch of samples
 *  is read before the buffer is unmapped. A session that never ran holds
 *  no samples and may close directly from Created or Armed.
 */

#ifndef PIPA_CORE_SESSION_STATE_HPP_
#define PIPA_CORE_SESSION_STATE_HPP_

#include "pipa/core/errors.hpp"

#include <cstdint>
#include <expected>
#include <string_view>

namespace pipa::core
{

/**
 *  States of a SamplingSession.
 */
enum class SessionState : std::uint8_t
{
    /**
     *  Counter handle open, buffer not yet mapped.
     */
    kCreated = 0,

    /**
     *  Buffer mapped, counter disabled.
     */
    kArmed = 1,

    /**
     *  Counter enabled; the kernel may write into the buffer.
     */
    kRunning = 2,

    /**
     *  Counter disabled; the buffer is being read to exhaustion.
     */
    kDraining = 3,

    /**
     *  Buffer unmapped and handle closed. Terminal.
     */
    kClosed = 4,
};

/**
 *  Converts a SessionState to its human-readable string representation.
 *
 *  @param      state  The state to convert.
 *  @return     A string view naming the state.
 */
[[nodiscard]] constexpr auto toString(SessionState state) noexcept -> std::string_view
{
    switch (state)
    {
        case SessionState::kCreated:
            return "created";
        case SessionState::kArmed:
            return "armed";
        case SessionState::kRunning:
            return "running";
        case SessionState::kDraining:
            return "draining";
        case SessionState::kClosed:
            return "closed";
    }
    return "invalid";
}

/**
 *  Checks whether a session may move from one state to another.
 *
 *  @param      from  The current state.
 *  @param      to    The requested state.
 *  @return     Success, or PerfError::kInvalidState if the transition is
 *              not allowed.
 */
[[nodiscard]] constexpr auto checkTransition(SessionState from, SessionState to) noexcept
    -> std::expected<void, PerfError>
{
    bool allowed = false;

    switch (from)
    {
        case SessionState::kCreated:
            allowed = (to == SessionState::kArmed || to == SessionState::kClosed);
            break;
        case SessionState::kArmed:
            allowed = (to == SessionState::kRunning || to == SessionState::kClosed);
            break;
        case SessionState::kRunning:
            // Closing straight from Running would drop the final batch
            allowed = (to == SessionState::kDraining);
            break;
        case SessionState::kDraining:
            allowed = (to == SessionState::kClosed);
            break;
        case SessionState::kClosed:
            allowed = false;
            break;
    }

    if (!allowed)
    {
        return std::unexpected(PerfError::kInvalidState);
    }
    return {};
}

/**
 *  Checks whether samples may be read in the given state.
 *
 *  @param      state  The current state.
 *  @return     True in Running and Draining.
 */
[[nodiscard]] constexpr auto canReadSamples(SessionState state) noexcept -> bool
{
    return state == SessionState::kRunning || state == SessionState::kDraining;
}

}  // namespace pipa::core

#endif  // PIPA_CORE_SESSION_STATE_HPP_
