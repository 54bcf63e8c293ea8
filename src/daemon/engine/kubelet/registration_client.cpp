//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "registration_client.hpp"

#include "engine_helpers.hpp"
#include "logging.hpp"

#include "deviceplugin/v1beta1/api.grpc.pb.h"
#include "deviceplugin/v1beta1/api.pb.h"

#include <cetl/pf17/cetlpf.hpp>

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <string>

namespace mnicdp
{
namespace daemon
{
namespace engine
{
namespace kubelet
{

v1beta1::RegisterRequest RegistrationClient::makeRequest(const std::string& plugin_socket_path,
                                                         const std::string& resource_name)
{
    const auto slash_pos = plugin_socket_path.find_last_of('/');
    const auto endpoint  = (slash_pos == std::string::npos) ? plugin_socket_path  //
                                                            : plugin_socket_path.substr(slash_pos + 1);

    v1beta1::RegisterRequest request;
    request.set_version(ApiVersion);
    request.set_endpoint(endpoint);
    request.set_resource_name(resource_name);
    request.mutable_options()->set_pre_start_required(true);
    return request;
}

cetl::optional<std::string> RegistrationClient::registerPlugin(const std::string&              kubelet_socket_path,
                                                               const v1beta1::RegisterRequest& request,
                                                               const std::chrono::milliseconds timeout)
{
    const auto logger = common::getLogger("kubelet");

    const auto channel = dialUnixSocket(kubelet_socket_path, timeout);
    if (!channel)
    {
        return "Failed to connect to kubelet socket '" + kubelet_socket_path + "'.";
    }

    logger->info("Register to kubelet with endpoint '{}' (resource='{}', ver='{}').",
                 request.endpoint(),
                 request.resource_name(),
                 request.version());

    const auto          stub = v1beta1::Registration::NewStub(channel);
    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + timeout);

    v1beta1::Empty response;
    const auto     status = stub->Register(&context, request, &response);
    if (!status.ok())
    {
        return "Kubelet registration has failed (code=" + std::to_string(static_cast<int>(status.error_code())) +
               "): " + status.error_message();
    }

    logger->info("Registered to kubelet.");
    return cetl::nullopt;
}

}  // namespace kubelet
}  // namespace engine
}  // namespace daemon
}  // namespace mnicdp
