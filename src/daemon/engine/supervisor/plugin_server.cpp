//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "plugin_server.hpp"

#include "engine_helpers.hpp"
#include "mnicdp/platform/posix_utils.hpp"
#include "restart_policy.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

namespace mnicdp
{
namespace daemon
{
namespace engine
{
namespace supervisor
{

PluginServer::PluginServer(grpc::Service&                  service,
                           std::string                     socket_path,
                           const std::chrono::milliseconds dial_timeout)
    : service_{service}
    , socket_path_{std::move(socket_path)}
    , dial_timeout_{dial_timeout}
    , is_stopping_{false}
    , has_failed_{false}
{
}

PluginServer::~PluginServer()
{
    stop();
}

cetl::optional<std::string> PluginServer::start()
{
    CETL_DEBUG_ASSERT(!serve_thread_.joinable(), "");

    if (const auto err = platform::unlinkIfExists(socket_path_))
    {
        std::string msg = "Failed to remove stale socket '" + socket_path_ + "': " + std::strerror(err);
        logger_->error(msg);
        return msg;
    }

    serve_thread_ = std::thread{[this] { serveLoop(); }};

    // Wait for server to start by launching a blocking connection.
    if (!dialUnixSocket(socket_path_, dial_timeout_))
    {
        std::string msg = "Plugin socket '" + socket_path_ + "' is not reachable.";
        logger_->error(msg);
        return msg;
    }

    logger_->info("Plugin server is ready (socket='{}').", socket_path_);
    return cetl::nullopt;
}

void PluginServer::stop()
{
    grpc::Server* server = nullptr;
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        is_stopping_ = true;
        server       = server_.get();
    }
    if (server != nullptr)
    {
        logger_->debug("Shutting down plugin server...");
        server->Shutdown(std::chrono::system_clock::now() + dial_timeout_);
    }

    if (serve_thread_.joinable())
    {
        serve_thread_.join();
    }

    const std::lock_guard<std::mutex> lock{mutex_};
    server_.reset();
}

void PluginServer::serveLoop()
{
    RestartPolicy restart_policy{RestartPolicy::Clock::now()};
    while (true)
    {
        grpc::Server* server = nullptr;
        {
            const std::lock_guard<std::mutex> lock{mutex_};
            if (is_stopping_)
            {
                break;
            }
            server_ = buildAndStart();
            server  = server_.get();
        }

        if (server != nullptr)
        {
            logger_->info("Serving gRPC on '{}'...", socket_path_);
            server->Wait();
        }

        {
            const std::lock_guard<std::mutex> lock{mutex_};
            if (is_stopping_)
            {
                break;
            }
        }

        logger_->error("gRPC server on '{}' has crashed.", socket_path_);
        if (restart_policy.onServeFailure(RestartPolicy::Clock::now()) == RestartPolicy::Decision::GiveUp)
        {
            logger_->critical("gRPC server on '{}' has repeatedly crashed recently (restarts={}). Quitting.",
                              socket_path_,
                              restart_policy.restartCount());
            has_failed_ = true;
            break;
        }
        logger_->warn("Restarting gRPC server (restarts={})...", restart_policy.restartCount());
    }
    logger_->debug("Serve loop has finished.");
}

std::unique_ptr<grpc::Server> PluginServer::buildAndStart()
{
    if (const auto err = platform::unlinkIfExists(socket_path_))
    {
        logger_->error("Failed to remove stale socket '{}': {}.", socket_path_, std::strerror(err));
        return nullptr;
    }

    grpc::ServerBuilder builder;
    builder.AddListeningPort(unixSocketTarget(socket_path_), grpc::InsecureServerCredentials());
    builder.RegisterService(&service_);

    auto server = builder.BuildAndStart();
    if (!server)
    {
        logger_->error("Failed to start gRPC server on '{}'.", socket_path_);
    }
    return server;
}

}  // namespace supervisor
}  // namespace engine
}  // namespace daemon
}  // namespace mnicdp
