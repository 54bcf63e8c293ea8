//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MNICDP_DAEMON_ENGINE_CONFIG_HPP_INCLUDED
#define MNICDP_DAEMON_ENGINE_CONFIG_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace mnicdp
{
namespace daemon
{
namespace engine
{

/// Read-only daemon configuration.
///
/// Every device plugin getter falls back to a built-in default if the key is absent.
///
class Config
{
public:
    using Ptr = std::shared_ptr<Config>;

    struct Defaults
    {
        static constexpr auto        ResourceName  = "multus.network.dataworkbench.io/multus-nic-device";
        static constexpr auto        DevicesDir    = "/var/lib/multus-nic-device";
        static constexpr std::size_t TotalDevices  = 40;
        static constexpr auto        PluginDir     = "/var/lib/kubelet/device-plugins/";
        static constexpr auto        Endpoint      = "multus-nic.sock";
        static constexpr auto        KubeletSocket = "kubelet.sock";
        static constexpr auto        AllocateEnv   = "MULTUS_NICS";
        static constexpr int         DialTimeoutMs = 5000;
        static constexpr int         WatchPollMs   = 1000;
    };

    /// Loads configuration from the given TOML file.
    ///
    /// A missing file yields the all-defaults configuration; a malformed one throws.
    ///
    CETL_NODISCARD static Ptr make(std::string file_path);

    Config(const Config&)                = delete;
    Config(Config&&) noexcept            = delete;
    Config& operator=(const Config&)     = delete;
    Config& operator=(Config&&) noexcept = delete;

    virtual ~Config() = default;

    CETL_NODISCARD virtual auto getResourceName() const -> std::string                  = 0;
    CETL_NODISCARD virtual auto getDevicesDir() const -> std::string                    = 0;
    CETL_NODISCARD virtual auto getTotalDevices() const -> std::size_t                  = 0;
    CETL_NODISCARD virtual auto getPluginDir() const -> std::string                     = 0;
    CETL_NODISCARD virtual auto getPluginEndpoint() const -> std::string                = 0;
    CETL_NODISCARD virtual auto getKubeletSocket() const -> std::string                 = 0;
    CETL_NODISCARD virtual auto getAllocateEnvName() const -> std::string               = 0;
    CETL_NODISCARD virtual auto getDialTimeout() const -> std::chrono::milliseconds     = 0;
    CETL_NODISCARD virtual auto getWatchPollPeriod() const -> std::chrono::milliseconds = 0;

    CETL_NODISCARD virtual auto getLoggingFile() const -> cetl::optional<std::string>       = 0;
    CETL_NODISCARD virtual auto getLoggingLevel() const -> cetl::optional<std::string>      = 0;
    CETL_NODISCARD virtual auto getLoggingFlushLevel() const -> cetl::optional<std::string> = 0;

    /// Full path of the plugin's own unix socket.
    std::string getPluginSocketPath() const
    {
        return joinPath(getPluginDir(), getPluginEndpoint());
    }

    /// Full path of the kubelet registration socket.
    std::string getKubeletSocketPath() const
    {
        return joinPath(getPluginDir(), getKubeletSocket());
    }

protected:
    Config() = default;

private:
    static std::string joinPath(const std::string& dir, const std::string& name)
    {
        if (dir.empty() || (dir.back() == '/'))
        {
            return dir + name;
        }
        return dir + '/' + name;
    }

};  // Config

}  // namespace engine
}  // namespace daemon
}  // namespace mnicdp

#endif  // MNICDP_DAEMON_ENGINE_CONFIG_HPP_INCLUDED
