//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MNICDP_DAEMON_ENGINE_DEVICE_REGISTRY_HPP_INCLUDED
#define MNICDP_DAEMON_ENGINE_DEVICE_REGISTRY_HPP_INCLUDED

#include "logging.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mnicdp
{
namespace daemon
{
namespace engine
{
namespace device
{

enum class DeviceHealth : std::uint8_t
{
    Healthy,
    Unhealthy,

};  // DeviceHealth

struct Device
{
    std::string  id;
    DeviceHealth health;

};  // Device

inline bool operator==(const Device& lhs, const Device& rhs)
{
    return (lhs.id == rhs.id) && (lhs.health == rhs.health);
}

/// Fixed capacity, ordered set of devices partitioned by a single watermark.
///
/// Devices with index below the watermark are in use (`Unhealthy`), the rest are available (`Healthy`).
/// The set is created once, and its size never changes afterwards.
///
/// Mutators are supposed to be called by the single owner of the watermark (the device watcher);
/// `snapshot` may be called concurrently from any thread.
///
class DeviceRegistry final
{
public:
    using Ptr      = std::unique_ptr<DeviceRegistry>;
    using Snapshot = std::vector<Device>;

    struct MakeResult
    {
        using Failure = int;  // aka errno
        using Success = Ptr;
        using Var     = cetl::variant<Success, Failure>;
    };
    /// Builds registry with `total_count` devices, where the number of entries of the `devices_dir`
    /// defines how many of them are already in use.
    ///
    static MakeResult::Var make(const std::string& devices_dir, const std::size_t total_count);

    struct CountResult
    {
        using Failure = int;  // aka errno
        using Success = std::size_t;
        using Var     = cetl::variant<Success, Failure>;
    };
    /// Counts entries of the directory (excluding "." and "..").
    ///
    static CountResult::Var countDirEntries(const std::string& dir_path);

    DeviceRegistry(const std::size_t total_count, const std::size_t in_use_count);

    DeviceRegistry(const DeviceRegistry&)                = delete;
    DeviceRegistry(DeviceRegistry&&) noexcept            = delete;
    DeviceRegistry& operator=(const DeviceRegistry&)     = delete;
    DeviceRegistry& operator=(DeviceRegistry&&) noexcept = delete;

    ~DeviceRegistry() = default;

    std::size_t totalCount() const noexcept
    {
        return devices_.size();
    }

    std::size_t watermark() const;
    Snapshot    snapshot() const;

    /// Marks the next available device as in use.
    ///
    /// @return `false` if all devices are already in use (the registry is left unchanged).
    ///
    bool acquireNext();

    /// Marks the last in use device as available.
    ///
    /// @return `false` if none of devices is in use (the registry is left unchanged).
    ///
    bool releaseLast();

private:
    mutable std::mutex  mutex_;
    std::vector<Device> devices_;
    std::size_t         watermark_;

};  // DeviceRegistry

}  // namespace device
}  // namespace engine
}  // namespace daemon
}  // namespace mnicdp

#endif  // MNICDP_DAEMON_ENGINE_DEVICE_REGISTRY_HPP_INCLUDED
