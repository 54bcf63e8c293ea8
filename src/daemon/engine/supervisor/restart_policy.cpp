//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "restart_policy.hpp"

namespace mnicdp
{
namespace daemon
{
namespace engine
{
namespace supervisor
{

RestartPolicy::Decision RestartPolicy::onServeFailure(const TimePoint now)
{
    const auto since_last_crash = now - last_crash_time_;
    last_crash_time_            = now;

    if (since_last_crash > StableWindow)
    {
        restart_count_ = 1;
    }
    else
    {
        ++restart_count_;
    }

    return (restart_count_ > MaxRestarts) ? Decision::GiveUp : Decision::Restart;
}

}  // namespace supervisor
}  // namespace engine
}  // namespace daemon
}  // namespace mnicdp
