//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "cancellation.hpp"

#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace mnicdp
{
namespace daemon
{
namespace engine
{

Cancellation::CallbackId Cancellation::onCancel(Callback callback)
{
    CallbackId callback_id = 0;
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        callback_id = next_callback_id_++;
        if (!is_cancelled_)
        {
            callbacks_.emplace(callback_id, std::move(callback));
            return callback_id;
        }
    }
    callback();
    return callback_id;
}

void Cancellation::removeCallback(const CallbackId callback_id)
{
    std::unique_lock<std::mutex> lock{mutex_};
    callbacks_.erase(callback_id);

    // A callback may remove itself (or another one) while `cancel` is running it on this very thread.
    if (cancelling_thread_ == std::this_thread::get_id())
    {
        return;
    }
    callback_done_.wait(lock, [this, callback_id] {
        //
        return running_callback_id_ != callback_id;
    });
}

void Cancellation::cancel()
{
    std::unique_lock<std::mutex> lock{mutex_};
    if (is_cancelled_)
    {
        return;
    }
    is_cancelled_      = true;
    cancelling_thread_ = std::this_thread::get_id();

    while (!callbacks_.empty())
    {
        auto           first    = callbacks_.begin();
        const Callback callback = std::move(first->second);
        running_callback_id_    = first->first;
        callbacks_.erase(first);

        lock.unlock();
        callback();
        lock.lock();

        running_callback_id_.reset();
        callback_done_.notify_all();
    }

    cancelling_thread_ = std::thread::id{};
}

}  // namespace engine
}  // namespace daemon
}  // namespace mnicdp
