//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "io.hpp"

#include "logging.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <string>
#include <sys/inotify.h>
#include <unistd.h>
#include <utility>

namespace mnicdp
{
namespace common
{
namespace io
{

InotifyWatch::MakeResult::Var InotifyWatch::make(const std::string& path, const std::uint32_t mask)
{
    const int fd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0)
    {
        return errno;
    }
    InotifyWatch watch{fd, -1};

    const int wd = ::inotify_add_watch(fd, path.c_str(), mask);
    if (wd < 0)
    {
        const int err = errno;
        getLogger("io")->debug("Failed to watch '{}': {}.", path, std::strerror(err));
        return err;
    }
    watch.wd_ = wd;

    return std::move(watch);
}

void InotifyWatch::reset() noexcept
{
    if (fd_ < 0)
    {
        return;
    }

    if ((wd_ >= 0) && (::inotify_rm_watch(fd_, wd_) < 0))
    {
        const int err = errno;
        getLogger("io")->warn("Failed to remove watch (fd={}, wd={}): {}.", fd_, wd_, std::strerror(err));
    }
    wd_ = -1;

    // `close` must not be retried on `EINTR`.
    if (::close(fd_) < 0)
    {
        const int err = errno;
        getLogger("io")->error("Failed to close inotify descriptor {}: {}.", fd_, std::strerror(err));
    }
    fd_ = -1;
}

}  // namespace io
}  // namespace common
}  // namespace mnicdp
