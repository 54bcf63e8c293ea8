//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "change_notifier.hpp"

#include "cancellation.hpp"

#include <chrono>
#include <mutex>

namespace mnicdp
{
namespace daemon
{
namespace engine
{
namespace device
{

ChangeNotifier::ChangeNotifier(Cancellation& cancellation)
    : cancellation_{cancellation}
    , on_cancel_id_{0}
    , generation_{0}
{
    on_cancel_id_ = cancellation_.onCancel([this] { wakeAll(); });
}

ChangeNotifier::~ChangeNotifier()
{
    cancellation_.removeCallback(on_cancel_id_);
}

ChangeNotifier::Generation ChangeNotifier::generation() const
{
    const std::lock_guard<std::mutex> lock{mutex_};
    return generation_;
}

void ChangeNotifier::notify()
{
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        ++generation_;
    }
    cv_.notify_all();
}

ChangeNotifier::WaitResult ChangeNotifier::waitForChange(Generation& seen, const std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock{mutex_};

    const bool is_woken = cv_.wait_for(lock, timeout, [this, &seen] {
        //
        return cancellation_.isCancelled() || (generation_ != seen);
    });

    if (cancellation_.isCancelled())
    {
        return WaitResult::Cancelled;
    }
    if (!is_woken)
    {
        return WaitResult::TimedOut;
    }

    seen = generation_;
    return WaitResult::Changed;
}

void ChangeNotifier::wakeAll()
{
    // A waiter is either before its predicate check or blocked on the condition variable here.
    {
        const std::lock_guard<std::mutex> lock{mutex_};
    }
    cv_.notify_all();
}

}  // namespace device
}  // namespace engine
}  // namespace daemon
}  // namespace mnicdp
