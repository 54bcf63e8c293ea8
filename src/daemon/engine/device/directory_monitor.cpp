//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "directory_monitor.hpp"

#include "io/io.hpp"
#include "logging.hpp"
#include "mnicdp/platform/posix_utils.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <array>
#include <cerrno>
#include <chrono>
#include <climits>
#include <cstddef>
#include <cstring>
#include <memory>
#include <poll.h>
#include <string>
#include <sys/inotify.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace mnicdp
{
namespace daemon
{
namespace engine
{
namespace device
{
namespace
{

constexpr std::uint32_t CreatedMask = IN_CREATE | IN_MOVED_TO;
constexpr std::uint32_t RemovedMask = IN_DELETE | IN_MOVED_FROM;

class InotifyDirectoryMonitorImpl final : public IDirectoryMonitor
{
public:
    InotifyDirectoryMonitorImpl(common::io::InotifyWatch&& watch, std::string dir_path)
        : watch_{std::move(watch)}
        , dir_path_{std::move(dir_path)}
    {
        logger_->debug("Watching dir '{}' (fd={}, wd={}).", dir_path_, watch_.fd(), watch_.watchDescriptor());
    }

    ~InotifyDirectoryMonitorImpl() override = default;

    InotifyDirectoryMonitorImpl(const InotifyDirectoryMonitorImpl&)                = delete;
    InotifyDirectoryMonitorImpl(InotifyDirectoryMonitorImpl&&) noexcept            = delete;
    InotifyDirectoryMonitorImpl& operator=(const InotifyDirectoryMonitorImpl&)     = delete;
    InotifyDirectoryMonitorImpl& operator=(InotifyDirectoryMonitorImpl&&) noexcept = delete;

    // MARK: IDirectoryMonitor

    PollResult::Var pollFor(const std::chrono::milliseconds timeout) override
    {
        pollfd poll_fd{watch_.fd(), POLLIN, 0};
        int    poll_result = 0;
        if (const auto err = platform::posixSyscallError([&poll_fd, &poll_result, timeout] {
                //
                poll_result = ::poll(&poll_fd, 1, static_cast<int>(timeout.count()));
                return poll_result;
            }))
        {
            return err;
        }
        if ((poll_result == 0) || ((poll_fd.revents & POLLIN) == 0))
        {
            return PollResult::Success{};
        }

        alignas(inotify_event) std::array<char, EventsBufferSize> buffer{};
        ssize_t                                                   bytes_read = 0;
        if (const auto err = platform::posixSyscallError([this, &buffer, &bytes_read] {
                //
                bytes_read = ::read(watch_.fd(), buffer.data(), buffer.size());
                return bytes_read;
            }))
        {
            return (err == EAGAIN) ? PollResult::Var{PollResult::Success{}} : PollResult::Var{err};
        }

        return parseEvents(buffer.data(), static_cast<std::size_t>(bytes_read));
    }

private:
    static constexpr std::size_t EventsBufferSize = 64 * (sizeof(inotify_event) + NAME_MAX + 1);

    PollResult::Success parseEvents(const char* const data, const std::size_t size)
    {
        PollResult::Success events;

        std::size_t offset = 0;
        while ((offset + sizeof(inotify_event)) <= size)
        {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast, cppcoreguidelines-pro-bounds-pointer-arithmetic)
            const auto* const raw_event = reinterpret_cast<const inotify_event*>(data + offset);
            offset += sizeof(inotify_event) + raw_event->len;

            std::string name;
            if (raw_event->len > 0)
            {
                name = raw_event->name;  // NOLINT(cppcoreguidelines-pro-bounds-array-to-pointer-decay)
            }

            if ((raw_event->mask & IN_Q_OVERFLOW) != 0)
            {
                events.push_back({EventKind::Overflowed, std::move(name)});
            }
            else if ((raw_event->mask & CreatedMask) != 0)
            {
                events.push_back({EventKind::Created, std::move(name)});
            }
            else if ((raw_event->mask & RemovedMask) != 0)
            {
                events.push_back({EventKind::Removed, std::move(name)});
            }
            else if ((raw_event->mask & IN_IGNORED) != 0)
            {
                watch_.forgetWatch();
                events.push_back({EventKind::WatchRemoved, dir_path_});
            }
        }
        return events;
    }

    common::LoggerPtr        logger_{common::getLogger("device")};
    common::io::InotifyWatch watch_;
    const std::string        dir_path_;

};  // InotifyDirectoryMonitorImpl

}  // namespace

InotifyDirectoryMonitor::MakeResult::Var InotifyDirectoryMonitor::make(const std::string& dir_path)
{
    using WatchResult = common::io::InotifyWatch::MakeResult;

    auto maybe_watch = common::io::InotifyWatch::make(dir_path, CreatedMask | RemovedMask);
    if (const auto* const err = cetl::get_if<WatchResult::Failure>(&maybe_watch))
    {
        return *err;
    }

    auto& watch = cetl::get<WatchResult::Success>(maybe_watch);
    return std::make_unique<InotifyDirectoryMonitorImpl>(std::move(watch), dir_path);
}

}  // namespace device
}  // namespace engine
}  // namespace daemon
}  // namespace mnicdp
