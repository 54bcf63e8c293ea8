//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MNICDP_DAEMON_ENGINE_SUPERVISOR_PLUGIN_SERVER_HPP_INCLUDED
#define MNICDP_DAEMON_ENGINE_SUPERVISOR_PLUGIN_SERVER_HPP_INCLUDED

#include "logging.hpp"
#include "restart_policy.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <grpcpp/grpcpp.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace mnicdp
{
namespace daemon
{
namespace engine
{
namespace supervisor
{

/// Owns the gRPC server bound to the plugin's unix domain socket.
///
/// Serving happens on a dedicated thread, which rebuilds the server after failures
/// (as long as the restart policy allows it). Once the policy gives up, the server is marked as failed.
///
class PluginServer final
{
public:
    PluginServer(grpc::Service& service, std::string socket_path, const std::chrono::milliseconds dial_timeout);

    PluginServer(const PluginServer&)                = delete;
    PluginServer(PluginServer&&) noexcept            = delete;
    PluginServer& operator=(const PluginServer&)     = delete;
    PluginServer& operator=(PluginServer&&) noexcept = delete;

    ~PluginServer();

    /// Removes a stale socket file, starts the serve loop, and waits until the socket accepts connections.
    ///
    CETL_NODISCARD cetl::optional<std::string> start();

    /// Shuts down the gRPC server and joins the serve loop thread.
    ///
    /// Long-lived streaming calls are expected to be ended (cancelled) beforehand -
    /// otherwise they are forcibly cancelled after the dial timeout.
    ///
    void stop();

    /// `true` if the serve loop has given up restarting the server.
    ///
    bool hasFailed() const noexcept
    {
        return has_failed_;
    }

    const std::string& socketPath() const noexcept
    {
        return socket_path_;
    }

private:
    void                          serveLoop();
    std::unique_ptr<grpc::Server> buildAndStart();

    common::LoggerPtr               logger_{common::getLogger("engine")};
    grpc::Service&                  service_;
    const std::string               socket_path_;
    const std::chrono::milliseconds dial_timeout_;
    std::mutex                      mutex_;
    bool                            is_stopping_;
    std::unique_ptr<grpc::Server>   server_;
    std::atomic<bool>               has_failed_;
    std::thread                     serve_thread_;

};  // PluginServer

}  // namespace supervisor
}  // namespace engine
}  // namespace daemon
}  // namespace mnicdp

#endif  // MNICDP_DAEMON_ENGINE_SUPERVISOR_PLUGIN_SERVER_HPP_INCLUDED
