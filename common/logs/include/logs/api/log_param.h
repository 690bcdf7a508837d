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

#ifndef OBSERVABILITY_API_LOGS_LOG_PARAM_H
#define OBSERVABILITY_API_LOGS_LOG_PARAM_H

#include <cstdint>
#include <string>

namespace observability::api::logs {

const int DEFAULT_MAX_SIZE = 100;  // 100 MB
const int DEFAULT_LOG_BUF_SECONDS = 30;
const uint32_t DEFAULT_MAX_FILES = 3;
const uint32_t DEFAULT_MAX_ASYNC_QUEUE_SIZE = 51200;
const uint32_t DEFAULT_ASYNC_THREAD_COUNT = 1;
const int64_t SIZE_MEGA_BYTES = 1024 * 1024;  // 1 MB
const uint32_t ASYNC_THREAD_COUNT_MAX = 10;
const int FILES_COUNT_MAX = 500;
const int FILE_SIZE_MAX = 1024;                        // 1024 MB
const uint32_t MAX_ASYNC_QUEUE_SIZE_MAX = 2097152;     // 1024 * 1024 * 2

const std::string CORE_LOGGER_NAME = "CoreLogger";

struct LogParam {
    std::string loggerName = CORE_LOGGER_NAME;
    std::string logLevel = "INFO";
    std::string logDir = ".";
    std::string nodeName;
    std::string modelName;
    std::string pattern;
    bool alsoLog2Std = false;
    int maxSize = DEFAULT_MAX_SIZE;
    uint32_t maxFiles = DEFAULT_MAX_FILES;
    std::string stdLogLevel = "ERROR";
};

struct GlobalLogParam {
    int logBufSecs = DEFAULT_LOG_BUF_SECONDS;
    uint32_t maxAsyncQueueSize = DEFAULT_MAX_ASYNC_QUEUE_SIZE;
    uint32_t asyncThreadCount = DEFAULT_ASYNC_THREAD_COUNT;
};
}  // namespace observability::api::logs

#endif  // OBSERVABILITY_API_LOGS_LOG_PARAM_H
