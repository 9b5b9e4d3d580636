/**
 *  @file       test_session_state.cpp
 *
 *  Unit tests for the sampling session lifecycle rules.
 */

#include "pipa/core/errors.hpp"
#include "pipa/core/session_state.hpp"

#include <array>

#include <catch2/catch_test_macros.hpp>

using pipa::core::canReadSamples;
using pipa::core::checkTransition;
using pipa::core::PerfError;
using pipa::core::SessionState;

TEST_CASE("SessionState toString", "[core][SessionState]")
{
    REQUIRE(pipa::core::toString(SessionState::kCreated) == "created");
    REQUIRE(pipa::core::toString(SessionState::kArmed) == "armed");
    REQUIRE(pipa::core::toString(SessionState::kRunning) == "running");
    REQUIRE(pipa::core::toString(SessionState::kDraining) == "draining");
    REQUIRE(pipa::core::toString(SessionState::kClosed) == "closed");
}

TEST_CASE("Lifecycle allows the forward path", "[core][SessionState]")
{
    REQUIRE(checkTransition(SessionState::kCreated, SessionState::kArmed).has_value());
    REQUIRE(checkTransition(SessionState::kArmed, SessionState::kRunning).has_value());
    REQUIRE(checkTransition(SessionState::kRunning, SessionState::kDraining).has_value());
    REQUIRE(checkTransition(SessionState::kDraining, SessionState::kClosed).has_value());
}

TEST_CASE("Lifecycle allows closing before the session ran", "[core][SessionState]")
{
    REQUIRE(checkTransition(SessionState::kCreated, SessionState::kClosed).has_value());
    REQUIRE(checkTransition(SessionState::kArmed, SessionState::kClosed).has_value());
}

TEST_CASE("Lifecycle rejects skipping and going back", "[core][SessionState]")
{
    SECTION("Created cannot start without arming")
    {
        auto result = checkTransition(SessionState::kCreated, SessionState::kRunning);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error() == PerfError::kInvalidState);
    }

    SECTION("Running cannot close without draining")
    {
        REQUIRE_FALSE(checkTransition(SessionState::kRunning, SessionState::kClosed).has_value());
    }

    SECTION("Draining cannot restart")
    {
        REQUIRE_FALSE(checkTransition(SessionState::kDraining, SessionState::kRunning).has_value());
    }

    SECTION("Closed is terminal")
    {
        constexpr std::array kAll = {SessionState::kCreated, SessionState::kArmed,
                                     SessionState::kRunning, SessionState::kDraining,
                                     SessionState::kClosed};
        for (auto target : kAll)
        {
            REQUIRE_FALSE(checkTransition(SessionState::kClosed, target).has_value());
        }
    }
}

TEST_CASE("Samples are readable only while running or draining", "[core][SessionState]")
{
    REQUIRE_FALSE(canReadSamples(SessionState::kCreated));
    REQUIRE_FALSE(canReadSamples(SessionState::kArmed));
    REQUIRE(canReadSamples(SessionState::kRunning));
    REQUIRE(canReadSamples(SessionState::kDraining));
    REQUIRE_FALSE(canReadSamples(SessionState::kClosed));
}

static_assert(checkTransition(SessionState::kCreated, SessionState::kArmed).has_value());
static_assert(!checkTransition(SessionState::kClosed, SessionState::kCreated).has_value());
