//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MNICDP_DAEMON_ENGINE_DEVICE_DIRECTORY_MONITOR_HPP_INCLUDED
#define MNICDP_DAEMON_ENGINE_DEVICE_DIRECTORY_MONITOR_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace mnicdp
{
namespace daemon
{
namespace engine
{
namespace device
{

/// Source of entry creation/removal events of a single directory.
///
class IDirectoryMonitor
{
public:
    using Ptr = std::unique_ptr<IDirectoryMonitor>;

    enum class EventKind : std::uint8_t
    {
        Created,
        Removed,
        Overflowed,    // Some events were dropped by the kernel.
        WatchRemoved,  // The directory itself is gone (or unmounted).

    };  // EventKind

    struct Event
    {
        EventKind   kind;
        std::string name;

    };  // Event

    struct PollResult
    {
        using Failure = int;  // aka errno
        using Success = std::vector<Event>;
        using Var     = cetl::variant<Success, Failure>;
    };

    IDirectoryMonitor(const IDirectoryMonitor&)                = delete;
    IDirectoryMonitor(IDirectoryMonitor&&) noexcept            = delete;
    IDirectoryMonitor& operator=(const IDirectoryMonitor&)     = delete;
    IDirectoryMonitor& operator=(IDirectoryMonitor&&) noexcept = delete;

    virtual ~IDirectoryMonitor() = default;

    /// Waits (up to the given timeout) for new events.
    ///
    /// Empty success means that nothing has happened during the timeout.
    ///
    virtual PollResult::Var pollFor(const std::chrono::milliseconds timeout) = 0;

protected:
    IDirectoryMonitor() = default;

};  // IDirectoryMonitor

/// Linux `inotify` based implementation of the directory monitor.
///
class InotifyDirectoryMonitor final
{
public:
    struct MakeResult
    {
        using Failure = int;  // aka errno
        using Success = IDirectoryMonitor::Ptr;
        using Var     = cetl::variant<Success, Failure>;
    };
    static MakeResult::Var make(const std::string& dir_path);

    InotifyDirectoryMonitor() = delete;

};  // InotifyDirectoryMonitor

}  // namespace device
}  // namespace engine
}  // namespace daemon
}  // namespace mnicdp

#endif  // MNICDP_DAEMON_ENGINE_DEVICE_DIRECTORY_MONITOR_HPP_INCLUDED
