/*
 * Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "logs/sdk/logger_provider.h"

#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>
#include <iostream>
#include <map>
#include <vector>

#include "logs/sdk/log_param_parser.h"

namespace observability::sdk::logs {
namespace LogsApi = observability::api::logs;

static spdlog::level::level_enum GetLogLevel(const std::string &level)
{
    static const std::map<std::string, spdlog::level::level_enum> LOG_LEVEL_MAP = {
        { "DEBUG", spdlog::level::debug },
        { "INFO", spdlog::level::info },
        { "WARN", spdlog::level::warn },
        { "ERROR", spdlog::level::err },
        { "FATAL", spdlog::level::critical },
    };
    auto iter = LOG_LEVEL_MAP.find(level);
    return iter == LOG_LEVEL_MAP.end() ? spdlog::level::info : iter->second;
}

LoggerProvider::LoggerProvider() noexcept : LoggerProvider(LogsApi::GlobalLogParam{})
{
}

LoggerProvider::LoggerProvider(const LogsApi::GlobalLogParam &globalLogParam) noexcept
    : globalLogParam_(globalLogParam)
{
    spdlog::drop_all();
    if (!spdlog::thread_pool()) {
        try {
            spdlog::init_thread_pool(static_cast<size_t>(globalLogParam_.maxAsyncQueueSize),
                                     static_cast<size_t>(globalLogParam_.asyncThreadCount));
        } catch (const std::exception &e) {
            std::cerr << "failed to init log thread pool, error: " << e.what() << std::endl;
        }
    }
    spdlog::flush_every(std::chrono::seconds(globalLogParam_.logBufSecs));
}

LoggerProvider::~LoggerProvider()
{
    (void)ForceFlush();
}

LogsApi::VsLogger LoggerProvider::GetLogger(const std::string &loggerName) noexcept
{
    return spdlog::get(loggerName);
}

LogsApi::VsLogger LoggerProvider::CreateLogger(const LogsApi::LogParam &logParam) noexcept
{
    if (auto logger = spdlog::get(logParam.loggerName); logger != nullptr) {
        return logger;
    }
    if (!spdlog::thread_pool()) {
        std::cerr << "failed to init logger " << logParam.loggerName << ", no log thread pool" << std::endl;
        return nullptr;
    }
    try {
        std::vector<spdlog::sink_ptr> sinks{};
        auto rotatingSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            GetLogFile(logParam), static_cast<size_t>(logParam.maxSize * LogsApi::SIZE_MEGA_BYTES),
            static_cast<size_t>(logParam.maxFiles));
        (void)sinks.emplace_back(rotatingSink);
        if (logParam.alsoLog2Std) {
            auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            consoleSink->set_level(GetLogLevel(logParam.stdLogLevel));
            (void)sinks.emplace_back(consoleSink);
        }
        auto logger = std::make_shared<spdlog::async_logger>(logParam.loggerName, sinks.begin(), sinks.end(),
                                                             spdlog::thread_pool(),
                                                             spdlog::async_overflow_policy::block);
        spdlog::initialize_logger(logger);
        logger->set_level(GetLogLevel(logParam.logLevel));
        logger->set_pattern(logParam.pattern, spdlog::pattern_time_type::utc);
        return logger;
    } catch (const std::exception &e) {
        std::cerr << "failed to init logger, error: " << e.what() << std::endl;
        return nullptr;
    }
}

void LoggerProvider::DropLogger(const std::string &loggerName) noexcept
{
    spdlog::drop(loggerName);
}

bool LoggerProvider::ForceFlush() noexcept
{
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger> &l) {
        if (l != nullptr) {
            l->flush();
        }
    });
    return true;
}

}  // namespace observability::sdk::logs
