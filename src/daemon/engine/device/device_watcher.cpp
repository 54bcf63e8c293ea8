//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "device_watcher.hpp"

#include "change_notifier.hpp"
#include "device_registry.hpp"
#include "directory_monitor.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <cstring>
#include <thread>
#include <utility>

namespace mnicdp
{
namespace daemon
{
namespace engine
{
namespace device
{

DeviceWatcher::DeviceWatcher(IDirectoryMonitor::Ptr monitor, DeviceRegistry& registry, ChangeNotifier& notifier)
    : monitor_{std::move(monitor)}
    , registry_{registry}
    , notifier_{notifier}
{
    CETL_DEBUG_ASSERT(monitor_, "");
}

void DeviceWatcher::spinOnce(const std::chrono::milliseconds timeout)
{
    using PollResult = IDirectoryMonitor::PollResult;

    auto maybe_events = monitor_->pollFor(timeout);
    if (const auto* const err = cetl::get_if<PollResult::Failure>(&maybe_events))
    {
        logger_->warn("Failed to poll devices dir: {}.", std::strerror(*err));

        // Don't let a persistent failure turn the watch loop into a busy one.
        std::this_thread::sleep_for(timeout);
        return;
    }

    for (const auto& event : cetl::get<PollResult::Success>(maybe_events))
    {
        (void) handleEvent(event);
    }
}

bool DeviceWatcher::handleEvent(const IDirectoryMonitor::Event& event)
{
    using EventKind = IDirectoryMonitor::EventKind;

    bool is_changed = false;
    switch (event.kind)
    {
    case EventKind::Created:
        logger_->info("Device event: CREATE, name: '{}'.", event.name);
        is_changed = registry_.acquireNext();
        if (!is_changed)
        {
            logger_->info("All {} devices are already in use - event is ignored.", registry_.totalCount());
        }
        break;

    case EventKind::Removed:
        logger_->info("Device event: REMOVE, name: '{}'.", event.name);
        is_changed = registry_.releaseLast();
        if (!is_changed)
        {
            logger_->info("None of devices is in use - event is ignored.");
        }
        break;

    case EventKind::Overflowed:
        logger_->warn("Device events queue has overflowed - device counts may drift from the dir content.");
        return false;

    case EventKind::WatchRemoved:
        logger_->error("Devices dir '{}' is not watched anymore.", event.name);
        return false;
    }

    if (is_changed)
    {
        notifier_.notify();
    }
    logCounts();
    return is_changed;
}

void DeviceWatcher::logCounts() const
{
    const auto total = registry_.totalCount();
    const auto used  = registry_.watermark();
    logger_->info("Current available devices count: {}, used: {}, total: {}.", total - used, used, total);
}

}  // namespace device
}  // namespace engine
}  // namespace daemon
}  // namespace mnicdp
