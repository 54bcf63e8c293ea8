//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MNICDP_DAEMON_ENGINE_SVC_DEVICE_PLUGIN_SERVICE_HPP_INCLUDED
#define MNICDP_DAEMON_ENGINE_SVC_DEVICE_PLUGIN_SERVICE_HPP_INCLUDED

#include "device/device_registry.hpp"
#include "logging.hpp"
#include "svc_helpers.hpp"

#include "deviceplugin/v1beta1/api.grpc.pb.h"

#include <grpcpp/grpcpp.h>

namespace mnicdp
{
namespace daemon
{
namespace engine
{
namespace svc
{

/// Implements the kubelet `v1beta1.DevicePlugin` service.
///
/// All handlers except `ListAndWatch` are stateless, and never touch the registry.
///
class DevicePluginService final : public v1beta1::DevicePlugin::Service
{
public:
    static constexpr auto HealthyStr   = "Healthy";
    static constexpr auto UnhealthyStr = "Unhealthy";

    explicit DevicePluginService(const SvcContext& context);

    DevicePluginService(const DevicePluginService&)                = delete;
    DevicePluginService(DevicePluginService&&) noexcept            = delete;
    DevicePluginService& operator=(const DevicePluginService&)     = delete;
    DevicePluginService& operator=(DevicePluginService&&) noexcept = delete;

    ~DevicePluginService() override = default;

    static void fillListAndWatchResponse(const device::DeviceRegistry::Snapshot& snapshot,
                                         v1beta1::ListAndWatchResponse&          response);

    // MARK: v1beta1::DevicePlugin::Service

    grpc::Status GetDevicePluginOptions(grpc::ServerContext*          context,
                                        const v1beta1::Empty*         request,
                                        v1beta1::DevicePluginOptions* response) override;

    grpc::Status ListAndWatch(grpc::ServerContext*                             context,
                              const v1beta1::Empty*                            request,
                              grpc::ServerWriter<v1beta1::ListAndWatchResponse>* writer) override;

    grpc::Status GetPreferredAllocation(grpc::ServerContext*                       context,
                                        const v1beta1::PreferredAllocationRequest* request,
                                        v1beta1::PreferredAllocationResponse*      response) override;

    grpc::Status Allocate(grpc::ServerContext*            context,
                          const v1beta1::AllocateRequest* request,
                          v1beta1::AllocateResponse*      response) override;

    grpc::Status PreStartContainer(grpc::ServerContext*                     context,
                                   const v1beta1::PreStartContainerRequest* request,
                                   v1beta1::PreStartContainerResponse*      response) override;

private:
    common::LoggerPtr logger_{common::getLogger("plugin")};
    const SvcContext  context_;

};  // DevicePluginService

}  // namespace svc
}  // namespace engine
}  // namespace daemon
}  // namespace mnicdp

#endif  // MNICDP_DAEMON_ENGINE_SVC_DEVICE_PLUGIN_SERVICE_HPP_INCLUDED
