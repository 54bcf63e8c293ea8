//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MNICDP_TMP_DIR_HPP_INCLUDED
#define MNICDP_TMP_DIR_HPP_INCLUDED

#include <gtest/gtest.h>

#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <ftw.h>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace mnicdp
{

/// Unique temporary directory which is removed (recursively) on destruction.
///
class TmpDir final
{
public:
    TmpDir()
    {
        std::string templ = ::testing::TempDir() + "mnicdp-XXXXXX";
        std::vector<char> buf{templ.begin(), templ.end()};
        buf.push_back('\0');
        if (::mkdtemp(buf.data()) != nullptr)
        {
            path_ = buf.data();
        }
    }

    TmpDir(const TmpDir&)                = delete;
    TmpDir(TmpDir&&) noexcept            = delete;
    TmpDir& operator=(const TmpDir&)     = delete;
    TmpDir& operator=(TmpDir&&) noexcept = delete;

    ~TmpDir()
    {
        if (!path_.empty())
        {
            constexpr int max_open_fds = 16;
            (void) ::nftw(path_.c_str(), removeEntry, max_open_fds, FTW_DEPTH | FTW_PHYS);
        }
    }

    const std::string& path() const noexcept
    {
        return path_;
    }

    std::string file(const std::string& name) const
    {
        return path_ + "/" + name;
    }

    /// Creates an empty file; returns `false` on failure.
    ///
    bool touch(const std::string& name) const
    {
        const int fd = ::open(file(name).c_str(), O_CREAT | O_WRONLY | O_CLOEXEC, 0644);  // NOLINT *-vararg
        if (fd == -1)
        {
            return false;
        }
        ::close(fd);
        return true;
    }

    bool remove(const std::string& name) const
    {
        return ::unlink(file(name).c_str()) == 0;
    }

private:
    static int removeEntry(const char* const path, const struct stat*, const int, struct FTW*)
    {
        return ::remove(path);
    }

    std::string path_;

};  // TmpDir

}  // namespace mnicdp

#endif  // MNICDP_TMP_DIR_HPP_INCLUDED
