//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "device_plugin_service.hpp"

#include "device/device_registry.hpp"
#include "list_and_watch_session.hpp"
#include "svc_helpers.hpp"

#include "deviceplugin/v1beta1/api.grpc.pb.h"
#include "deviceplugin/v1beta1/api.pb.h"

#include <grpcpp/grpcpp.h>

#include <string>

namespace mnicdp
{
namespace daemon
{
namespace engine
{
namespace svc
{
namespace
{

template <typename Strings>
std::string joinWithComma(const Strings& strings)
{
    std::string result;
    for (const auto& str : strings)
    {
        if (!result.empty())
        {
            result += ',';
        }
        result += str;
    }
    return result;
}

}  // namespace

DevicePluginService::DevicePluginService(const SvcContext& context)
    : context_{context}
{
}

void DevicePluginService::fillListAndWatchResponse(const device::DeviceRegistry::Snapshot& snapshot,
                                                   v1beta1::ListAndWatchResponse&          response)
{
    response.clear_devices();
    for (const auto& dev : snapshot)
    {
        auto* const pb_device = response.add_devices();
        pb_device->set_id(dev.id);
        pb_device->set_health((dev.health == device::DeviceHealth::Healthy) ? HealthyStr : UnhealthyStr);
    }
}

grpc::Status DevicePluginService::GetDevicePluginOptions(grpc::ServerContext*,
                                                         const v1beta1::Empty*,
                                                         v1beta1::DevicePluginOptions* response)
{
    logger_->info("GetDevicePluginOptions called.");

    response->set_pre_start_required(true);
    response->set_get_preferred_allocation_available(false);
    return grpc::Status::OK;
}

grpc::Status DevicePluginService::ListAndWatch(grpc::ServerContext* context,
                                               const v1beta1::Empty*,
                                               grpc::ServerWriter<v1beta1::ListAndWatchResponse>* writer)
{
    logger_->info("ListAndWatch called (peer='{}').", context->peer());

    ListAndWatchSession session{context_,
                                [writer](const ListAndWatchSession::Snapshot& snapshot) {
                                    //
                                    v1beta1::ListAndWatchResponse response;
                                    fillListAndWatchResponse(snapshot, response);
                                    return writer->Write(response);
                                },
                                [context] { return context->IsCancelled(); }};

    switch (session.run())
    {
    case ListAndWatchSession::Outcome::SendFailed:
        return grpc::Status{grpc::StatusCode::UNAVAILABLE, "Failed to send device list."};

    case ListAndWatchSession::Outcome::Cancelled:
    case ListAndWatchSession::Outcome::ClientGone:
        break;
    }
    return grpc::Status::OK;
}

grpc::Status DevicePluginService::GetPreferredAllocation(grpc::ServerContext*,
                                                         const v1beta1::PreferredAllocationRequest*,
                                                         v1beta1::PreferredAllocationResponse*)
{
    logger_->info("GetPreferredAllocation called.");

    // No preference - the kubelet picks devices on its own.
    return grpc::Status::OK;
}

grpc::Status DevicePluginService::Allocate(grpc::ServerContext*,
                                           const v1beta1::AllocateRequest* request,
                                           v1beta1::AllocateResponse*      response)
{
    logger_->info("Allocate called (containers={}).", request->container_requests_size());

    for (const auto& container_request : request->container_requests())
    {
        const auto device_ids = joinWithComma(container_request.devices_ids());
        logger_->info("Received request: '{}'.", device_ids);

        auto* const container_response = response->add_container_responses();
        (*container_response->mutable_envs())[context_.allocate_env_name] = device_ids;
    }
    return grpc::Status::OK;
}

grpc::Status DevicePluginService::PreStartContainer(grpc::ServerContext*,
                                                    const v1beta1::PreStartContainerRequest*,
                                                    v1beta1::PreStartContainerResponse*)
{
    logger_->info("PreStartContainer called.");
    return grpc::Status::OK;
}

}  // namespace svc
}  // namespace engine
}  // namespace daemon
}  // namespace mnicdp
