//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MNICDP_DAEMON_ENGINE_SUPERVISOR_RESTART_POLICY_HPP_INCLUDED
#define MNICDP_DAEMON_ENGINE_SUPERVISOR_RESTART_POLICY_HPP_INCLUDED

#include <chrono>
#include <cstdint>

namespace mnicdp
{
namespace daemon
{
namespace engine
{
namespace supervisor
{

/// Crash-loop protection of the serve loop.
///
/// A failure which happens more than `StableWindow` after the previous one starts a new series (count = 1),
/// otherwise it extends the current series. Once a series is longer than `MaxRestarts` the policy gives up.
///
/// The policy doesn't read any clock - current time is always supplied by the caller.
///
class RestartPolicy final
{
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    static constexpr std::chrono::hours StableWindow{1};
    static constexpr std::uint32_t      MaxRestarts = 5;

    enum class Decision : std::uint8_t
    {
        Restart,
        GiveUp,

    };  // Decision

    /// @param start_time Serving start time - it is treated as the previous "crash" for the first failure.
    ///
    explicit RestartPolicy(const TimePoint start_time)
        : restart_count_{0}
        , last_crash_time_{start_time}
    {
    }

    Decision onServeFailure(const TimePoint now);

    std::uint32_t restartCount() const noexcept
    {
        return restart_count_;
    }

private:
    std::uint32_t restart_count_;
    TimePoint     last_crash_time_;

};  // RestartPolicy

}  // namespace supervisor
}  // namespace engine
}  // namespace daemon
}  // namespace mnicdp

#endif  // MNICDP_DAEMON_ENGINE_SUPERVISOR_RESTART_POLICY_HPP_INCLUDED
