//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MNICDP_COMMON_IO_HPP_INCLUDED
#define MNICDP_COMMON_IO_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <string>
#include <utility>

namespace mnicdp
{
namespace common
{
namespace io
{

/// RAII owner of an `inotify` instance together with its single watch.
///
/// On destruction (or `reset`) the watch is removed first, and then the instance descriptor is closed.
///
class InotifyWatch final
{
public:
    struct MakeResult
    {
        using Failure = int;  // aka errno
        using Success = InotifyWatch;
        using Var     = cetl::variant<Success, Failure>;
    };
    /// Creates a non-blocking `inotify` instance, and adds a watch of the given path to it.
    ///
    CETL_NODISCARD static MakeResult::Var make(const std::string& path, const std::uint32_t mask);

    InotifyWatch(InotifyWatch&& other) noexcept
        : fd_{std::exchange(other.fd_, -1)}
        , wd_{std::exchange(other.wd_, -1)}
    {
    }

    InotifyWatch& operator=(InotifyWatch&& other) noexcept
    {
        if (this != &other)
        {
            reset();
            fd_ = std::exchange(other.fd_, -1);
            wd_ = std::exchange(other.wd_, -1);
        }
        return *this;
    }

    // Disallow copy.
    InotifyWatch(const InotifyWatch&)            = delete;
    InotifyWatch& operator=(const InotifyWatch&) = delete;

    ~InotifyWatch()
    {
        reset();
    }

    int fd() const noexcept
    {
        return fd_;
    }

    int watchDescriptor() const noexcept
    {
        return wd_;
    }

    bool isWatching() const noexcept
    {
        return wd_ >= 0;
    }

    /// Marks the watch as already removed by the kernel (see `IN_IGNORED`).
    ///
    void forgetWatch() noexcept
    {
        wd_ = -1;
    }

    void reset() noexcept;

private:
    InotifyWatch(const int fd, const int wd)
        : fd_{fd}
        , wd_{wd}
    {
    }

    int fd_;
    int wd_;

};  // InotifyWatch

}  // namespace io
}  // namespace common
}  // namespace mnicdp

#endif  // MNICDP_COMMON_IO_HPP_INCLUDED
