//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MNICDP_DAEMON_ENGINE_DEVICE_WATCHER_HPP_INCLUDED
#define MNICDP_DAEMON_ENGINE_DEVICE_WATCHER_HPP_INCLUDED

#include "change_notifier.hpp"
#include "device_registry.hpp"
#include "directory_monitor.hpp"
#include "logging.hpp"

#include <chrono>

namespace mnicdp
{
namespace daemon
{
namespace engine
{
namespace device
{

/// Translates directory entry creations/removals into single-step watermark transitions of the registry.
///
/// The watcher is the only writer of the registry. Every accepted transition is followed
/// by exactly one change notification; rejected ones (saturated or empty registry) are just logged.
///
/// NB! The watcher only counts entries - there is no association between a particular file and a device,
/// and there is no re-synchronization if the directory and the registry ever disagree.
///
class DeviceWatcher final
{
public:
    DeviceWatcher(IDirectoryMonitor::Ptr monitor, DeviceRegistry& registry, ChangeNotifier& notifier);

    DeviceWatcher(const DeviceWatcher&)                = delete;
    DeviceWatcher(DeviceWatcher&&) noexcept            = delete;
    DeviceWatcher& operator=(const DeviceWatcher&)     = delete;
    DeviceWatcher& operator=(DeviceWatcher&&) noexcept = delete;

    ~DeviceWatcher() = default;

    /// Polls the directory monitor (up to the given timeout), and handles all the received events.
    ///
    /// Monitor failures are logged, and do not stop the watching.
    ///
    void spinOnce(const std::chrono::milliseconds timeout);

    /// @return `true` if the event has changed the registry (and so a notification was emitted).
    ///
    bool handleEvent(const IDirectoryMonitor::Event& event);

private:
    void logCounts() const;

    common::LoggerPtr      logger_{common::getLogger("device")};
    IDirectoryMonitor::Ptr monitor_;
    DeviceRegistry&        registry_;
    ChangeNotifier&        notifier_;

};  // DeviceWatcher

}  // namespace device
}  // namespace engine
}  // namespace daemon
}  // namespace mnicdp

#endif  // MNICDP_DAEMON_ENGINE_DEVICE_WATCHER_HPP_INCLUDED
