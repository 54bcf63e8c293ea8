//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "device/device_watcher.hpp"

#include "daemon/engine/device/directory_monitor_mock.hpp"
#include "cancellation.hpp"
#include "device/change_notifier.hpp"
#include "device/device_registry.hpp"
#include "device/directory_monitor.hpp"
#include "tmp_dir.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <string>
#include <vector>

namespace
{

using namespace mnicdp::daemon::engine::device;  // NOLINT This our main concern here in the unit tests.
using mnicdp::daemon::engine::Cancellation;

using testing::Each;
using testing::Field;
using testing::NotNull;
using testing::Return;
using testing::StrictMock;

// https://github.com/llvm/llvm-project/issues/53444
// NOLINTBEGIN(misc-unused-using-decls, misc-include-cleaner)
using std::literals::chrono_literals::operator""ms;
// NOLINTEND(misc-unused-using-decls, misc-include-cleaner)

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestDeviceWatcher : public testing::Test
{
protected:
    using Event      = IDirectoryMonitor::Event;
    using EventKind  = IDirectoryMonitor::EventKind;
    using PollResult = IDirectoryMonitor::PollResult;

    DeviceWatcher makeWatcher(DeviceRegistry& registry)
    {
        return DeviceWatcher{DirectoryMonitorRefWrapper::make(monitor_mock_), registry, notifier_};
    }

    // NOLINTBEGIN
    StrictMock<DirectoryMonitorMock> monitor_mock_;
    Cancellation                     cancellation_;
    ChangeNotifier                   notifier_{cancellation_};
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestDeviceWatcher, create_marks_next_device_in_use)
{
    DeviceRegistry registry{40, 0};
    auto           watcher = makeWatcher(registry);

    const auto gen_before = notifier_.generation();
    EXPECT_TRUE(watcher.handleEvent({EventKind::Created, "net1"}));

    EXPECT_THAT(registry.watermark(), 1);
    EXPECT_THAT(registry.snapshot()[0].health, DeviceHealth::Unhealthy);
    EXPECT_THAT(notifier_.generation(), gen_before + 1);
}

TEST_F(TestDeviceWatcher, remove_releases_last_device)
{
    DeviceRegistry registry{40, 3};
    auto           watcher = makeWatcher(registry);

    const auto gen_before = notifier_.generation();
    EXPECT_TRUE(watcher.handleEvent({EventKind::Removed, "net3"}));

    EXPECT_THAT(registry.watermark(), 2);
    EXPECT_THAT(registry.snapshot()[2].health, DeviceHealth::Healthy);
    EXPECT_THAT(registry.snapshot()[1].health, DeviceHealth::Unhealthy);
    EXPECT_THAT(notifier_.generation(), gen_before + 1);
}

TEST_F(TestDeviceWatcher, create_then_removes_flip_devices_in_order)
{
    DeviceRegistry registry{40, 3};
    auto           watcher = makeWatcher(registry);

    auto gen = notifier_.generation();
    EXPECT_TRUE(watcher.handleEvent({EventKind::Created, "net4"}));
    EXPECT_THAT(registry.watermark(), 4);
    EXPECT_THAT(registry.snapshot()[3].health, DeviceHealth::Unhealthy);
    EXPECT_THAT(notifier_.generation(), gen + 1);

    gen = notifier_.generation();
    EXPECT_TRUE(watcher.handleEvent({EventKind::Removed, "net1"}));
    EXPECT_THAT(registry.watermark(), 3);
    EXPECT_THAT(registry.snapshot()[3].health, DeviceHealth::Healthy);
    EXPECT_THAT(registry.snapshot()[2].health, DeviceHealth::Unhealthy);
    EXPECT_THAT(notifier_.generation(), gen + 1);

    gen = notifier_.generation();
    EXPECT_TRUE(watcher.handleEvent({EventKind::Removed, "net2"}));
    EXPECT_THAT(registry.watermark(), 2);
    EXPECT_THAT(registry.snapshot()[2].health, DeviceHealth::Healthy);
    EXPECT_THAT(registry.snapshot()[1].health, DeviceHealth::Unhealthy);
    EXPECT_THAT(notifier_.generation(), gen + 1);
}

TEST_F(TestDeviceWatcher, create_on_full_dir_at_startup_is_ignored)
{
    mnicdp::TmpDir tmp_dir;
    for (int i = 0; i < 40; ++i)
    {
        ASSERT_TRUE(tmp_dir.touch("net" + std::to_string(i)));
    }
    auto maybe_registry = DeviceRegistry::make(tmp_dir.path(), 40);
    auto* const registry = cetl::get_if<DeviceRegistry::MakeResult::Success>(&maybe_registry);
    ASSERT_THAT(registry, NotNull());
    ASSERT_TRUE(*registry);
    EXPECT_THAT((*registry)->snapshot(), Each(Field(&Device::health, DeviceHealth::Unhealthy)));

    auto watcher = makeWatcher(**registry);

    const auto before     = (*registry)->snapshot();
    const auto gen_before = notifier_.generation();
    ASSERT_TRUE(tmp_dir.touch("net40"));
    EXPECT_FALSE(watcher.handleEvent({EventKind::Created, "net40"}));

    EXPECT_THAT((*registry)->watermark(), 40);
    EXPECT_THAT((*registry)->snapshot(), before);
    EXPECT_THAT(notifier_.generation(), gen_before);
}

TEST_F(TestDeviceWatcher, create_when_all_in_use_is_ignored)
{
    DeviceRegistry registry{2, 2};
    auto           watcher = makeWatcher(registry);

    const auto before     = registry.snapshot();
    const auto gen_before = notifier_.generation();
    EXPECT_FALSE(watcher.handleEvent({EventKind::Created, "net3"}));

    EXPECT_THAT(registry.snapshot(), before);
    EXPECT_THAT(notifier_.generation(), gen_before);
}

TEST_F(TestDeviceWatcher, remove_when_none_in_use_is_ignored)
{
    DeviceRegistry registry{2, 0};
    auto           watcher = makeWatcher(registry);

    const auto before     = registry.snapshot();
    const auto gen_before = notifier_.generation();
    EXPECT_FALSE(watcher.handleEvent({EventKind::Removed, "net1"}));

    EXPECT_THAT(registry.snapshot(), before);
    EXPECT_THAT(notifier_.generation(), gen_before);
}

TEST_F(TestDeviceWatcher, overflow_and_watch_removal_are_not_changes)
{
    DeviceRegistry registry{2, 1};
    auto           watcher = makeWatcher(registry);

    const auto gen_before = notifier_.generation();
    EXPECT_FALSE(watcher.handleEvent({EventKind::Overflowed, ""}));
    EXPECT_FALSE(watcher.handleEvent({EventKind::WatchRemoved, "/var/lib/multus-nic-device"}));

    EXPECT_THAT(registry.watermark(), 1);
    EXPECT_THAT(notifier_.generation(), gen_before);
}

TEST_F(TestDeviceWatcher, spinOnce_handles_all_polled_events)
{
    DeviceRegistry registry{40, 0};
    auto           watcher = makeWatcher(registry);

    EXPECT_CALL(monitor_mock_, pollFor(100ms))
        .WillOnce(Return(PollResult::Success{{EventKind::Created, "a"},
                                             {EventKind::Created, "b"},
                                             {EventKind::Created, "c"},
                                             {EventKind::Removed, "b"}}))
        .WillOnce(Return(PollResult::Success{}));

    auto seen = notifier_.generation();
    watcher.spinOnce(100ms);
    EXPECT_THAT(registry.watermark(), 2);
    EXPECT_THAT(notifier_.waitForChange(seen, 0ms), ChangeNotifier::WaitResult::Changed);

    // Nothing has happened.
    watcher.spinOnce(100ms);
    EXPECT_THAT(registry.watermark(), 2);
    EXPECT_THAT(notifier_.waitForChange(seen, 0ms), ChangeNotifier::WaitResult::TimedOut);
}

TEST_F(TestDeviceWatcher, spinOnce_survives_poll_failure)
{
    DeviceRegistry registry{40, 0};
    auto           watcher = makeWatcher(registry);

    EXPECT_CALL(monitor_mock_, pollFor(1ms))
        .WillOnce(Return(PollResult::Failure{EIO}))
        .WillOnce(Return(PollResult::Success{{EventKind::Created, "a"}}));

    watcher.spinOnce(1ms);
    EXPECT_THAT(registry.watermark(), 0);

    watcher.spinOnce(1ms);
    EXPECT_THAT(registry.watermark(), 1);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
