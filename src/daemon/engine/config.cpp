//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "config.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/spdlog.h>
#include <toml.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <unistd.h>
#include <utility>

namespace mnicdp
{
namespace daemon
{
namespace engine
{
namespace
{

class ConfigImpl final : public Config
{
public:
    using TomlConf  = toml::ordered_type_config;
    using TomlValue = toml::basic_value<TomlConf>;

    ConfigImpl(std::string file_path, TomlValue&& root)
        : file_path_{std::move(file_path)}
        , root_{std::move(root)}
    {
    }

    // Config

    auto getResourceName() const -> std::string override
    {
        return findOr("device_plugin", "resource_name", std::string{Defaults::ResourceName});
    }

    auto getDevicesDir() const -> std::string override
    {
        return findOr("device_plugin", "devices_dir", std::string{Defaults::DevicesDir});
    }

    auto getTotalDevices() const -> std::size_t override
    {
        const auto total = findOr("device_plugin", "total_devices", static_cast<std::int64_t>(Defaults::TotalDevices));
        return (total > 0) ? static_cast<std::size_t>(total) : 0;
    }

    auto getPluginDir() const -> std::string override
    {
        return findOr("device_plugin", "plugin_dir", std::string{Defaults::PluginDir});
    }

    auto getPluginEndpoint() const -> std::string override
    {
        return findOr("device_plugin", "endpoint", std::string{Defaults::Endpoint});
    }

    auto getKubeletSocket() const -> std::string override
    {
        return findOr("device_plugin", "kubelet_socket", std::string{Defaults::KubeletSocket});
    }

    auto getAllocateEnvName() const -> std::string override
    {
        return findOr("device_plugin", "allocate_env", std::string{Defaults::AllocateEnv});
    }

    auto getDialTimeout() const -> std::chrono::milliseconds override
    {
        const auto ms = findOr("device_plugin", "dial_timeout_ms", std::int64_t{Defaults::DialTimeoutMs});
        return std::chrono::milliseconds{(ms > 0) ? ms : Defaults::DialTimeoutMs};
    }

    auto getWatchPollPeriod() const -> std::chrono::milliseconds override
    {
        const auto ms = findOr("device_plugin", "watch_poll_ms", std::int64_t{Defaults::WatchPollMs});
        return std::chrono::milliseconds{(ms > 0) ? ms : Defaults::WatchPollMs};
    }

    auto getLoggingFile() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "file");
    }

    auto getLoggingLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "level");
    }

    auto getLoggingFlushLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "flush_level");
    }

private:
    template <typename T, typename... Keys>
    cetl::optional<T> findImpl(Keys&&... keys) const
    {
        try
        {
            return cetl::make_optional(toml::find<T>(root_, std::forward<Keys>(keys)...));

        } catch (const std::exception&)
        {
            return cetl::nullopt;
        }
    }

    template <typename T>
    T findOr(const char* const table, const char* const key, T&& default_value) const
    {
        if (auto value = findImpl<T>(table, key))
        {
            return std::move(value.value());
        }
        return std::forward<T>(default_value);
    }

    std::string file_path_;
    TomlValue   root_;

};  // ConfigImpl

}  // namespace

Config::Ptr Config::make(std::string file_path)
{
    if (::access(file_path.c_str(), F_OK) != 0)
    {
        spdlog::debug("Config file '{}' is not found - using defaults.", file_path);
        return std::make_shared<ConfigImpl>(std::move(file_path), ConfigImpl::TomlValue{ConfigImpl::TomlValue::table_type{}});
    }

    auto root = toml::parse<ConfigImpl::TomlConf>(file_path);
    return std::make_shared<ConfigImpl>(std::move(file_path), std::move(root));
}

}  // namespace engine
}  // namespace daemon
}  // namespace mnicdp
