//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "device_registry.hpp"

#include "logging.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <dirent.h>
#include <memory>
#include <mutex>
#include <string>

namespace mnicdp
{
namespace daemon
{
namespace engine
{
namespace device
{

DeviceRegistry::MakeResult::Var DeviceRegistry::make(const std::string& devices_dir, const std::size_t total_count)
{
    auto maybe_count = countDirEntries(devices_dir);
    if (const auto* const err = cetl::get_if<CountResult::Failure>(&maybe_count))
    {
        common::getLogger("device")->error("Failed to read devices dir '{}': {}.", devices_dir, std::strerror(*err));
        return *err;
    }
    const auto in_use_count = cetl::get<CountResult::Success>(maybe_count);

    auto registry = std::make_unique<DeviceRegistry>(total_count, in_use_count);
    common::getLogger("device")->info("Current available devices count: {}, used: {}, total: {}.",
                                      total_count - registry->watermark(),
                                      registry->watermark(),
                                      total_count);
    return registry;
}

DeviceRegistry::CountResult::Var DeviceRegistry::countDirEntries(const std::string& dir_path)
{
    DIR* const dir = ::opendir(dir_path.c_str());
    if (dir == nullptr)
    {
        return errno;
    }

    std::size_t count = 0;
    errno             = 0;
    while (const auto* const entry = ::readdir(dir))
    {
        if ((std::strcmp(entry->d_name, ".") != 0) && (std::strcmp(entry->d_name, "..") != 0))
        {
            ++count;
        }
    }
    const int read_err = errno;
    ::closedir(dir);

    if (read_err != 0)
    {
        return read_err;
    }
    return count;
}

DeviceRegistry::DeviceRegistry(const std::size_t total_count, const std::size_t in_use_count)
    : watermark_{std::min(in_use_count, total_count)}
{
    devices_.reserve(total_count);
    for (std::size_t index = 0; index < total_count; ++index)
    {
        const auto health = (index < watermark_) ? DeviceHealth::Unhealthy : DeviceHealth::Healthy;
        devices_.push_back({std::to_string(index), health});
    }
}

std::size_t DeviceRegistry::watermark() const
{
    const std::lock_guard<std::mutex> lock{mutex_};
    return watermark_;
}

DeviceRegistry::Snapshot DeviceRegistry::snapshot() const
{
    const std::lock_guard<std::mutex> lock{mutex_};
    return devices_;
}

bool DeviceRegistry::acquireNext()
{
    const std::lock_guard<std::mutex> lock{mutex_};

    if (watermark_ >= devices_.size())
    {
        return false;
    }
    devices_[watermark_].health = DeviceHealth::Unhealthy;
    ++watermark_;
    return true;
}

bool DeviceRegistry::releaseLast()
{
    const std::lock_guard<std::mutex> lock{mutex_};

    if (watermark_ == 0)
    {
        return false;
    }
    --watermark_;
    devices_[watermark_].health = DeviceHealth::Healthy;
    return true;
}

}  // namespace device
}  // namespace engine
}  // namespace daemon
}  // namespace mnicdp
