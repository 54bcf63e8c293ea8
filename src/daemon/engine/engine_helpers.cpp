//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "engine_helpers.hpp"

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <memory>
#include <string>

namespace mnicdp
{
namespace daemon
{
namespace engine
{

std::shared_ptr<grpc::Channel> dialUnixSocket(const std::string& socket_path, const std::chrono::milliseconds timeout)
{
    auto channel = grpc::CreateChannel(unixSocketTarget(socket_path), grpc::InsecureChannelCredentials());
    if (!channel->WaitForConnected(std::chrono::system_clock::now() + timeout))
    {
        return nullptr;
    }
    return channel;
}

}  // namespace engine
}  // namespace daemon
}  // namespace mnicdp
