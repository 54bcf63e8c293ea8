//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MNICDP_COMMON_LOGGING_HPP_INCLUDED
#define MNICDP_COMMON_LOGGING_HPP_INCLUDED

#include <cetl/cetl.hpp>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <array>
#include <exception>
#include <memory>
#include <string>

namespace mnicdp
{
namespace common
{

using Logger    = spdlog::logger;
using LoggerPtr = std::shared_ptr<Logger>;

/// Names of the daemon subsystem loggers (see `logging.level` configuration).
///
constexpr std::array<const char*, 5> SubsystemLoggerNames{"engine", "device", "plugin", "kubelet", "io"};

/// Gets a named subsystem logger.
///
/// If the logger is not registered yet (f.e. in unit tests), it is cloned from the default one
/// with its sinks and level.
///
inline LoggerPtr getLogger(const std::string& name) noexcept
{
    if (auto logger = spdlog::get(name))
    {
        return logger;
    }

    auto default_logger = spdlog::default_logger();
    CETL_DEBUG_ASSERT(default_logger, "default");

    auto logger = default_logger->clone(name);
    CETL_DEBUG_ASSERT(logger, name.c_str());

    try
    {
        spdlog::register_logger(logger);

    } catch (const spdlog::spdlog_ex&)
    {
        // Registered concurrently by another thread under the same name.
        if (auto registered = spdlog::get(name))
        {
            return registered;
        }
    } catch (const std::exception& ex)
    {
        default_logger->error("Failed to register '{}' logger: {}", name, ex.what());
    }

    return logger;
}

}  // namespace common
}  // namespace mnicdp

#endif  // MNICDP_COMMON_LOGGING_HPP_INCLUDED
