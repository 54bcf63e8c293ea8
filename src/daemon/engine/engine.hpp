//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MNICDP_DAEMON_ENGINE_HPP_INCLUDED
#define MNICDP_DAEMON_ENGINE_HPP_INCLUDED

#include "config.hpp"
#include "cancellation.hpp"
#include "device/change_notifier.hpp"
#include "device/device_registry.hpp"
#include "device/device_watcher.hpp"
#include "logging.hpp"
#include "supervisor/plugin_server.hpp"
#include "svc/device_plugin_service.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <functional>
#include <memory>
#include <string>

namespace mnicdp
{
namespace daemon
{
namespace engine
{

/// Supervises the device plugin: the device registry & its watcher, the gRPC plugin server,
/// and the registration with the kubelet.
///
class Engine
{
public:
    explicit Engine(Config::Ptr config);
    ~Engine();

    Engine(const Engine&)                = delete;
    Engine(Engine&&) noexcept            = delete;
    Engine& operator=(const Engine&)     = delete;
    Engine& operator=(Engine&&) noexcept = delete;

    /// Brings up everything except the kubelet registration.
    ///
    /// Any failure here is unrecoverable.
    ///
    CETL_NODISCARD cetl::optional<std::string> init();

    /// Informs the kubelet about the plugin endpoint.
    ///
    /// A failure here doesn't affect the already running plugin server.
    ///
    CETL_NODISCARD cetl::optional<std::string> registerWithKubelet();

    /// Runs the device watching loop while the predicate holds, and then shuts down.
    ///
    /// @return Failure description if the plugin server has given up restarting.
    ///
    CETL_NODISCARD cetl::optional<std::string> runWhile(const std::function<bool()>& loop_predicate);

    /// Cancels all streaming sessions, and stops the plugin server. Safe to call repeatedly.
    ///
    void shutdown();

private:
    Config::Ptr                               config_;
    common::LoggerPtr                         logger_{common::getLogger("engine")};
    Cancellation                      cancellation_;
    device::ChangeNotifier                    notifier_{cancellation_};
    device::DeviceRegistry::Ptr               registry_;
    std::unique_ptr<device::DeviceWatcher>    watcher_;
    std::unique_ptr<svc::DevicePluginService> plugin_service_;
    std::unique_ptr<supervisor::PluginServer> plugin_server_;

};  // Engine

}  // namespace engine
}  // namespace daemon
}  // namespace mnicdp

#endif  // MNICDP_DAEMON_ENGINE_HPP_INCLUDED
