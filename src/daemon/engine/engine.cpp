//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "engine.hpp"

#include "config.hpp"
#include "device/device_registry.hpp"
#include "device/device_watcher.hpp"
#include "device/directory_monitor.hpp"
#include "kubelet/registration_client.hpp"
#include "supervisor/plugin_server.hpp"
#include "svc/device_plugin_service.hpp"
#include "svc/svc_helpers.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstring>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace mnicdp
{
namespace daemon
{
namespace engine
{

Engine::Engine(Config::Ptr config)
    : config_{std::move(config)}
{
}

Engine::~Engine()
{
    shutdown();
}

cetl::optional<std::string> Engine::init()
{
    logger_->trace("Initializing engine...");

    const auto devices_dir  = config_->getDevicesDir();
    const auto total_count = config_->getTotalDevices();
    if (total_count == 0)
    {
        std::string msg = "Total devices count must be positive.";
        logger_->error(msg);
        return msg;
    }

    // 1. Build the device registry from the current content of the devices dir.
    //
    {
        using MakeResult = device::DeviceRegistry::MakeResult;

        auto maybe_registry = device::DeviceRegistry::make(devices_dir, total_count);
        if (const auto* const err = cetl::get_if<MakeResult::Failure>(&maybe_registry))
        {
            std::string msg = "Failed to list devices in '" + devices_dir + "': " + std::strerror(*err);
            logger_->error(msg);
            return msg;
        }
        registry_ = cetl::get<MakeResult::Success>(std::move(maybe_registry));
    }

    // 2. Attach the watch. From now on the kernel queues dir events for us,
    //    so nothing is lost until the run loop starts to consume them.
    //
    {
        using MakeResult = device::InotifyDirectoryMonitor::MakeResult;

        auto maybe_monitor = device::InotifyDirectoryMonitor::make(devices_dir);
        if (const auto* const err = cetl::get_if<MakeResult::Failure>(&maybe_monitor))
        {
            std::string msg = "Failed to watch devices in '" + devices_dir + "': " + std::strerror(*err);
            logger_->error(msg);
            return msg;
        }
        watcher_ = std::make_unique<device::DeviceWatcher>(cetl::get<MakeResult::Success>(std::move(maybe_monitor)),
                                                           *registry_,
                                                           notifier_);
    }

    // 3. Bring up the device plugin gRPC server.
    //
    const svc::SvcContext svc_context{*registry_,
                                      notifier_,
                                      cancellation_,
                                      config_->getAllocateEnvName(),
                                      config_->getWatchPollPeriod()};
    plugin_service_ = std::make_unique<svc::DevicePluginService>(svc_context);
    plugin_server_  = std::make_unique<supervisor::PluginServer>(*plugin_service_,
                                                                config_->getPluginSocketPath(),
                                                                config_->getDialTimeout());
    if (auto failure = plugin_server_->start())
    {
        return failure;
    }

    logger_->debug("Engine is initialized.");
    return cetl::nullopt;
}

cetl::optional<std::string> Engine::registerWithKubelet()
{
    using kubelet::RegistrationClient;

    const auto request = RegistrationClient::makeRequest(config_->getPluginSocketPath(), config_->getResourceName());
    return RegistrationClient::registerPlugin(config_->getKubeletSocketPath(), request, config_->getDialTimeout());
}

cetl::optional<std::string> Engine::runWhile(const std::function<bool()>& loop_predicate)
{
    CETL_DEBUG_ASSERT(watcher_ && plugin_server_, "Engine is not initialized.");

    logger_->info("Watching devices...");

    const auto poll_period = config_->getWatchPollPeriod();
    while (loop_predicate())
    {
        if (plugin_server_->hasFailed())
        {
            std::string msg = "Plugin server has failed.";
            logger_->critical(msg);
            shutdown();
            return msg;
        }

        // Poll dir events but awake at least once per poll period.
        watcher_->spinOnce(poll_period);
    }

    logger_->debug("Run loop predicate is fulfilled.");
    shutdown();
    return cetl::nullopt;
}

void Engine::shutdown()
{
    // Streaming sessions have to be ended first - server shutdown waits for all in-flight calls.
    cancellation_.cancel();

    if (plugin_server_)
    {
        plugin_server_->stop();
    }
}

}  // namespace engine
}  // namespace daemon
}  // namespace mnicdp
