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

#ifndef OBSERVABILITY_SDK_LOGS_LOGGER_PROVIDER_H
#define OBSERVABILITY_SDK_LOGS_LOGGER_PROVIDER_H

#include <memory>
#include <string>

#include "logs/api/log_param.h"
#include "logs/api/logger_provider.h"

namespace observability::sdk::logs {

class LoggerProvider final : public observability::api::logs::LoggerProvider {
public:
    LoggerProvider() noexcept;
    explicit LoggerProvider(const observability::api::logs::GlobalLogParam &globalLogParam) noexcept;
    ~LoggerProvider() override;

    observability::api::logs::VsLogger GetLogger(const std::string &loggerName) noexcept override;
    observability::api::logs::VsLogger CreateLogger(const observability::api::logs::LogParam &logParam) noexcept
        override;
    void DropLogger(const std::string &loggerName) noexcept override;

    bool ForceFlush() noexcept;

private:
    observability::api::logs::GlobalLogParam globalLogParam_;
};
}  // namespace observability::sdk::logs

#endif  // OBSERVABILITY_SDK_LOGS_LOGGER_PROVIDER_H
