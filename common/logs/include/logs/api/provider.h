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

#ifndef OBSERVABILITY_API_LOGS_PROVIDER_H
#define OBSERVABILITY_API_LOGS_PROVIDER_H

#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <mutex>
#include <shared_mutex>

#include "logs/api/logger_provider.h"

namespace observability::api::logs {

class Provider {
public:
    static std::shared_ptr<LoggerProvider> GetLoggerProvider() noexcept
    {
        std::shared_lock<std::shared_mutex> lock(GetLock());
        return GetProvider();
    }

    static void SetLoggerProvider(const std::shared_ptr<LoggerProvider> &lp) noexcept
    {
        std::unique_lock<std::shared_mutex> lock(GetLock());
        GetProvider() = lp;
    }

private:
    static std::shared_ptr<LoggerProvider> &GetProvider() noexcept
    {
        static std::shared_ptr<LoggerProvider> provider = std::make_shared<NullLoggerProvider>();
        return provider;
    }

    static std::shared_mutex &GetLock() noexcept
    {
        static std::shared_mutex lock;
        return lock;
    }
};

#define LOGS_LEVEL_DEBUG spdlog::level::debug
#define LOGS_LEVEL_INFO spdlog::level::info
#define LOGS_LEVEL_WARN spdlog::level::warn
#define LOGS_LEVEL_ERROR spdlog::level::err

#define LOGS_LOGGER(logger, level, ...)                       \
    do {                                                      \
        auto logsLogger = (logger);                           \
        if (logsLogger == nullptr) {                          \
            break;                                            \
        }                                                     \
        try {                                                 \
            SPDLOG_LOGGER_CALL(logsLogger, level, __VA_ARGS__); \
        } catch (const std::exception &e) {                   \
            std::cerr << e.what() << std::endl;               \
        }                                                     \
    } while (0)

inline VsLogger GetCoreLogger()
{
    auto lp = Provider::GetLoggerProvider();
    if (lp == nullptr) {
        return nullptr;
    }
    return lp->GetLogger(CORE_LOGGER_NAME);
}

#define LOGS_CORE_LOGGER(level, ...) LOGS_LOGGER(observability::api::logs::GetCoreLogger(), level, __VA_ARGS__)

}  // namespace observability::api::logs

#endif  // OBSERVABILITY_API_LOGS_PROVIDER_H
