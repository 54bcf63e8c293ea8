//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MNICDP_DAEMON_ENGINE_DEVICE_CHANGE_NOTIFIER_HPP_INCLUDED
#define MNICDP_DAEMON_ENGINE_DEVICE_CHANGE_NOTIFIER_HPP_INCLUDED

#include "cancellation.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace mnicdp
{
namespace daemon
{
namespace engine
{
namespace device
{

/// Payload-free "something has changed" signal between the device watcher and streaming sessions.
///
/// Signals are coalesced into a monotonic generation counter - a waiter which has missed several
/// notifications wakes up once, and is expected to re-read the whole registry state.
/// The producer never blocks on slow (or absent) consumers.
///
class ChangeNotifier final
{
public:
    using Generation = std::uint64_t;

    enum class WaitResult : std::uint8_t
    {
        Changed,
        TimedOut,
        Cancelled,

    };  // WaitResult

    explicit ChangeNotifier(Cancellation& cancellation);

    ChangeNotifier(const ChangeNotifier&)                = delete;
    ChangeNotifier(ChangeNotifier&&) noexcept            = delete;
    ChangeNotifier& operator=(const ChangeNotifier&)     = delete;
    ChangeNotifier& operator=(ChangeNotifier&&) noexcept = delete;

    ~ChangeNotifier();

    Generation generation() const;

    void notify();

    /// Blocks until the generation differs from the `seen` one, the cancellation is requested, or timeout.
    ///
    /// On `Changed` the `seen` generation is updated to the current one.
    /// Cancellation takes precedence over a pending change.
    ///
    WaitResult waitForChange(Generation& seen, const std::chrono::milliseconds timeout);

private:
    void wakeAll();

    Cancellation&            cancellation_;
    Cancellation::CallbackId on_cancel_id_;
    mutable std::mutex       mutex_;
    std::condition_variable  cv_;
    Generation               generation_;

};  // ChangeNotifier

}  // namespace device
}  // namespace engine
}  // namespace daemon
}  // namespace mnicdp

#endif  // MNICDP_DAEMON_ENGINE_DEVICE_CHANGE_NOTIFIER_HPP_INCLUDED
