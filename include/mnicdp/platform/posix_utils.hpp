//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MNICDP_PLATFORM_POSIX_UTILS_HPP_INCLUDED
#define MNICDP_PLATFORM_POSIX_UTILS_HPP_INCLUDED

#include <cerrno>
#include <string>
#include <unistd.h>

namespace mnicdp
{
namespace platform
{

/// Wraps a POSIX syscall and retries it if it was interrupted by a signal.
///
template <typename Call>
int posixSyscallError(const Call& call)
{
    while (call() < 0)
    {
        const int error_num = errno;
        if (error_num != EINTR)
        {
            return error_num;
        }
    }
    return 0;
}

/// Removes a file system entry (f.e. a stale unix domain socket file).
///
/// @return `0` if the entry was removed or did not exist, otherwise the `errno` of the failure.
///
inline int unlinkIfExists(const std::string& path)
{
    const int err = posixSyscallError([&path] {
        //
        return ::unlink(path.c_str());
    });
    return (err == ENOENT) ? 0 : err;
}

}  // namespace platform
}  // namespace mnicdp

#endif  // MNICDP_PLATFORM_POSIX_UTILS_HPP_INCLUDED
