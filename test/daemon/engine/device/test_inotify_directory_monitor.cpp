//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "device/directory_monitor.hpp"

#include "tmp_dir.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace
{

using namespace mnicdp::daemon::engine::device;  // NOLINT This our main concern here in the unit tests.

using testing::IsEmpty;
using testing::NotNull;
using testing::ElementsAre;

// https://github.com/llvm/llvm-project/issues/53444
// NOLINTBEGIN(misc-unused-using-decls, misc-include-cleaner)
using std::literals::chrono_literals::operator""ms;
// NOLINTEND(misc-unused-using-decls, misc-include-cleaner)

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestInotifyDirectoryMonitor : public testing::Test
{
protected:
    using Event      = IDirectoryMonitor::Event;
    using EventKind  = IDirectoryMonitor::EventKind;
    using PollResult = IDirectoryMonitor::PollResult;

    void SetUp() override
    {
        ASSERT_FALSE(tmp_dir_.path().empty());
    }

    IDirectoryMonitor::Ptr makeMonitor(const std::string& dir_path)
    {
        auto maybe_monitor = InotifyDirectoryMonitor::make(dir_path);
        if (auto* const monitor = cetl::get_if<InotifyDirectoryMonitor::MakeResult::Success>(&maybe_monitor))
        {
            return std::move(*monitor);
        }
        return nullptr;
    }

    /// Collects events until the monitor stays silent for a while.
    ///
    static std::vector<Event> drain(IDirectoryMonitor& monitor)
    {
        std::vector<Event> all_events;
        while (true)
        {
            auto maybe_events = monitor.pollFor(50ms);
            auto* const events = cetl::get_if<PollResult::Success>(&maybe_events);
            if ((events == nullptr) || events->empty())
            {
                return all_events;
            }
            all_events.insert(all_events.end(), events->begin(), events->end());
        }
    }

    static bool isEvent(const Event& event, const EventKind kind, const std::string& name)
    {
        return (event.kind == kind) && (event.name == name);
    }

    // NOLINTBEGIN
    mnicdp::TmpDir tmp_dir_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestInotifyDirectoryMonitor, make_for_missing_dir)
{
    const auto maybe_monitor = InotifyDirectoryMonitor::make(tmp_dir_.file("missing"));
    const auto* const err    = cetl::get_if<InotifyDirectoryMonitor::MakeResult::Failure>(&maybe_monitor);
    ASSERT_THAT(err, NotNull());
    EXPECT_THAT(*err, ENOENT);
}

TEST_F(TestInotifyDirectoryMonitor, poll_times_out_when_idle)
{
    const auto monitor = makeMonitor(tmp_dir_.path());
    ASSERT_THAT(monitor, NotNull());

    auto maybe_events = monitor->pollFor(10ms);
    const auto* const events = cetl::get_if<PollResult::Success>(&maybe_events);
    ASSERT_THAT(events, NotNull());
    EXPECT_THAT(*events, IsEmpty());
}

TEST_F(TestInotifyDirectoryMonitor, create_and_remove)
{
    const auto monitor = makeMonitor(tmp_dir_.path());
    ASSERT_THAT(monitor, NotNull());

    ASSERT_TRUE(tmp_dir_.touch("net1"));
    ASSERT_TRUE(tmp_dir_.touch("net2"));
    ASSERT_TRUE(tmp_dir_.remove("net1"));

    const auto events = drain(*monitor);
    ASSERT_THAT(events.size(), 3);
    EXPECT_TRUE(isEvent(events[0], EventKind::Created, "net1"));
    EXPECT_TRUE(isEvent(events[1], EventKind::Created, "net2"));
    EXPECT_TRUE(isEvent(events[2], EventKind::Removed, "net1"));
}

TEST_F(TestInotifyDirectoryMonitor, moves_in_and_out)
{
    const std::string other_dir = tmp_dir_.file("other");
    ASSERT_THAT(::mkdir(other_dir.c_str(), 0755), 0);
    ASSERT_TRUE(tmp_dir_.touch("other/net1"));

    const std::string watched_dir = tmp_dir_.file("watched");
    ASSERT_THAT(::mkdir(watched_dir.c_str(), 0755), 0);
    const auto monitor = makeMonitor(watched_dir);
    ASSERT_THAT(monitor, NotNull());

    ASSERT_THAT(std::rename((other_dir + "/net1").c_str(), (watched_dir + "/net1").c_str()), 0);
    ASSERT_THAT(std::rename((watched_dir + "/net1").c_str(), (other_dir + "/net1").c_str()), 0);

    const auto events = drain(*monitor);
    ASSERT_THAT(events.size(), 2);
    EXPECT_TRUE(isEvent(events[0], EventKind::Created, "net1"));
    EXPECT_TRUE(isEvent(events[1], EventKind::Removed, "net1"));
}

TEST_F(TestInotifyDirectoryMonitor, watched_dir_removal)
{
    const std::string watched_dir = tmp_dir_.file("watched");
    ASSERT_THAT(::mkdir(watched_dir.c_str(), 0755), 0);
    const auto monitor = makeMonitor(watched_dir);
    ASSERT_THAT(monitor, NotNull());

    ASSERT_THAT(::rmdir(watched_dir.c_str()), 0);

    const auto events = drain(*monitor);
    ASSERT_THAT(events.size(), 1);
    EXPECT_TRUE(isEvent(events[0], EventKind::WatchRemoved, watched_dir));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
