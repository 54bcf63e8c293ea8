//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MNICDP_DAEMON_ENGINE_CANCELLATION_HPP_INCLUDED
#define MNICDP_DAEMON_ENGINE_CANCELLATION_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace mnicdp
{
namespace daemon
{
namespace engine
{

/// Process lifetime cancellation scope.
///
/// Handed to every long-running task at construction. Once cancelled it stays cancelled.
///
class Cancellation final
{
public:
    using Callback   = std::function<void()>;
    using CallbackId = std::size_t;

    Cancellation()
        : is_cancelled_{false}
        , next_callback_id_{0}
    {
    }

    Cancellation(const Cancellation&)                = delete;
    Cancellation(Cancellation&&) noexcept            = delete;
    Cancellation& operator=(const Cancellation&)     = delete;
    Cancellation& operator=(Cancellation&&) noexcept = delete;

    ~Cancellation() = default;

    bool isCancelled() const
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        return is_cancelled_;
    }

    /// Registers a callback to be invoked on cancellation.
    ///
    /// The callback is invoked immediately (on the calling thread) if already cancelled.
    /// Owner of the callback must remove it (see `removeCallback`) before it goes away.
    ///
    CallbackId onCancel(Callback callback);

    /// Unregisters a callback.
    ///
    /// If the callback is being invoked by `cancel` on another thread, blocks until it returns.
    /// On return the callback is neither running nor going to be invoked. Unknown ids are ignored.
    ///
    void removeCallback(const CallbackId callback_id);

    /// Cancels the scope, and invokes all registered callbacks one by one (outside of the internal lock).
    ///
    void cancel();

private:
    mutable std::mutex             mutex_;
    std::condition_variable        callback_done_;
    bool                           is_cancelled_;
    CallbackId                     next_callback_id_;
    std::map<CallbackId, Callback> callbacks_;
    cetl::optional<CallbackId>     running_callback_id_;
    std::thread::id                cancelling_thread_;

};  // Cancellation

}  // namespace engine
}  // namespace daemon
}  // namespace mnicdp

#endif  // MNICDP_DAEMON_ENGINE_CANCELLATION_HPP_INCLUDED
