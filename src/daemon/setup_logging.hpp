//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MNICDP_DAEMON_SETUP_LOGGING_HPP_INCLUDED
#define MNICDP_DAEMON_SETUP_LOGGING_HPP_INCLUDED

#include "engine/config.hpp"
#include "logging.hpp"

#include <spdlog/cfg/argv.h>
#include <spdlog/cfg/helpers.h>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <unistd.h>
#include <vector>

namespace detail
{

inline std::string trimmed(const std::string& str)
{
    const auto first = str.find_first_not_of(" \t");
    if (first == std::string::npos)
    {
        return {};
    }
    const auto last = str.find_last_not_of(" \t");
    return str.substr(first, last - first + 1);
}

/// Parses "level,logger1=level1,logger2=level2" into a map, where the default level goes under the empty key.
///
inline std::unordered_map<std::string, std::string> extractKeyVals(const std::string& str)
{
    std::unordered_map<std::string, std::string> result;

    std::size_t pos = 0;
    while (pos <= str.size())
    {
        auto comma = str.find(',', pos);
        if (comma == std::string::npos)
        {
            comma = str.size();
        }
        const auto token = str.substr(pos, comma - pos);
        pos              = comma + 1;

        const auto eq = token.find('=');
        auto key = (eq == std::string::npos) ? std::string{} : trimmed(token.substr(0, eq));
        auto val = trimmed((eq == std::string::npos) ? token : token.substr(eq + 1));
        std::transform(val.begin(), val.end(), val.begin(), [](const unsigned char ch) {
            //
            return static_cast<char>(std::tolower(ch));
        });
        if (!val.empty())
        {
            result[std::move(key)] = std::move(val);
        }
    }
    return result;
}

inline void loadFlushLevels(const std::string& flush_levels)
{
    constexpr std::size_t max_levels_len = 512;
    if (flush_levels.empty() || (flush_levels.size() > max_levels_len))
    {
        return;
    }

    const auto key_vals = extractKeyVals(flush_levels);
    for (const auto& name_level : key_vals)
    {
        const auto& logger_name = name_level.first;
        const auto& level_name  = name_level.second;
        const auto  level       = spdlog::level::from_str(level_name);
        // Ignore unrecognized level names.
        if (level == spdlog::level::off && level_name != "off")
        {
            continue;
        }

        if (const auto logger = logger_name.empty() ? spdlog::default_logger() : spdlog::get(logger_name))
        {
            logger->flush_on(level);
        }
    }

    // Apply default flush level to all other loggers (if not specified in the `key_vals`).
    //
    const auto default_flush_level = spdlog::default_logger()->flush_level();
    spdlog::apply_all([&key_vals, default_flush_level](const std::shared_ptr<spdlog::logger>& logger) {
        //
        // Skip default logger and loggers with explicit flush levels.
        if (!logger->name().empty() && (key_vals.find(logger->name()) == key_vals.end()))
        {
            logger->flush_on(default_flush_level);
        }
    });
}

/// Search for SPDLOG_FLUSH_LEVEL= in the args and use it to init the flush levels.
///
inline void loadArgvFlushLevels(const int argc, const char** const argv)
{
    const std::string spdlog_level_prefix = "SPDLOG_FLUSH_LEVEL=";
    for (int i = 1; i < argc; i++)
    {
        const std::string arg_str = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg_str.find(spdlog_level_prefix) == 0)
        {
            loadFlushLevels(arg_str.substr(spdlog_level_prefix.size()));
        }
    }
}

}  // namespace detail

inline bool writeString(const int fd, const char* const str)
{
    const auto str_len = strlen(str);
    return static_cast<ssize_t>(str_len) == ::write(fd, str, str_len);
}

/// Sets up the logging system.
///
/// The colored standard error sink is always used,
/// while the rotating file sink is added only if `logging.file` is configured.
/// All subsystem loggers share the same sinks as the default logger.
///
inline void setupLogging(const int argc, const char** const argv, const mnicdp::daemon::engine::Config::Ptr& config)
{
    using spdlog::sinks::rotating_file_sink_mt;
    using spdlog::sinks::stderr_color_sink_mt;

    try
    {
        constexpr std::size_t log_files_max     = 4;
        constexpr std::size_t log_file_max_size = 16UL * 1048576UL;  // 16 MB

        // Drop all existing loggers, including the default one, so that we can reconfigure them.
        spdlog::drop_all();

        std::vector<spdlog::sink_ptr> sinks;

        const auto stderr_sink = std::make_shared<stderr_color_sink_mt>();
        stderr_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] '%n' | %v");
        sinks.push_back(stderr_sink);

        std::shared_ptr<rotating_file_sink_mt> file_sink;
        if (const auto logging_file = config->getLoggingFile())
        {
            file_sink = std::make_shared<rotating_file_sink_mt>(logging_file.value(), log_file_max_size, log_files_max);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%P] [%n] [%l] %v");
            sinks.push_back(file_sink);
        }

        const auto default_logger = std::make_shared<spdlog::logger>("", sinks.begin(), sinks.end());
        spdlog::register_logger(default_logger);
        spdlog::set_default_logger(default_logger);

        // Register specific subsystem loggers.
        //
        for (const auto* const name : mnicdp::common::SubsystemLoggerNames)
        {
            spdlog::register_logger(std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end()));
        }

        // Setup log levels from the configuration file.
        // Also accept `SPDLOG_LEVEL` & `SPDLOG_FLUSH_LEVEL` arguments if any (like `SPDLOG_LEVEL=info,device=trace`).
        //
        if (const auto logging_level = config->getLoggingLevel())
        {
            spdlog::cfg::helpers::load_levels(logging_level.value());
        }
        if (const auto logging_flush_level = config->getLoggingFlushLevel())
        {
            detail::loadFlushLevels(logging_flush_level.value());
        }
        spdlog::cfg::load_argv_levels(argc, argv);
        detail::loadArgvFlushLevels(argc, argv);

        // Insert "--…--" just to have clearer separation in the log file between two different process runs.
        //
        if (file_sink && spdlog::default_logger()->should_log(spdlog::level::info))
        {
            file_sink->log({"", spdlog::level::info, "--------------------------"});
        }

    } catch (const std::exception& ex)
    {
        writeString(STDERR_FILENO, "Failed to setup logging: ");
        writeString(STDERR_FILENO, ex.what());
        ::exit(EXIT_FAILURE);
    }
}

#endif  // MNICDP_DAEMON_SETUP_LOGGING_HPP_INCLUDED
