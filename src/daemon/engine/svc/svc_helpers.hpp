//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MNICDP_DAEMON_ENGINE_SVC_HELPERS_HPP_INCLUDED
#define MNICDP_DAEMON_ENGINE_SVC_HELPERS_HPP_INCLUDED

#include "cancellation.hpp"
#include "device/change_notifier.hpp"
#include "device/device_registry.hpp"

#include <chrono>
#include <string>

namespace mnicdp
{
namespace daemon
{
namespace engine
{
namespace svc
{

/// Everything a device plugin service handler needs, passed explicitly at construction.
///
/// The registry is read-only here - the device watcher is its only writer.
///
struct SvcContext
{
    const device::DeviceRegistry& registry;
    device::ChangeNotifier&       notifier;
    const Cancellation&   cancellation;
    std::string                   allocate_env_name;
    std::chrono::milliseconds     session_poll_period;

};  // SvcContext

}  // namespace svc
}  // namespace engine
}  // namespace daemon
}  // namespace mnicdp

#endif  // MNICDP_DAEMON_ENGINE_SVC_HELPERS_HPP_INCLUDED
