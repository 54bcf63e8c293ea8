//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MNICDP_DAEMON_ENGINE_HELPERS_HPP_INCLUDED
#define MNICDP_DAEMON_ENGINE_HELPERS_HPP_INCLUDED

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

/// Makes gRPC target name for the unix domain socket path.
///
inline std::string unixSocketTarget(const std::string& socket_path)
{
    return "unix:" + socket_path;
}

/// Opens a channel to a unix domain socket, and blocks until it is connected (or timed out).
///
/// @return `nullptr` if connection wasn't established in time.
///
std::shared_ptr<grpc::Channel> dialUnixSocket(const std::string& socket_path, const std::chrono::milliseconds timeout);

}  // namespace engine
}  // namespace daemon
}  // namespace mnicdp

#endif  // MNICDP_DAEMON_ENGINE_HELPERS_HPP_INCLUDED
