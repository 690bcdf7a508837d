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

#include "logs/sdk/log_param_parser.h"

#include <nlohmann/json.hpp>

#include <iostream>

namespace observability::sdk::logs {
namespace LogsApi = observability::api::logs;

namespace {
void ParseLogLevel(const nlohmann::json &confJson, LogsApi::LogParam &logParam)
{
    if (confJson.find("filepath") != confJson.end()) {
        logParam.logDir = confJson.at("filepath").get<std::string>();
    }
    if (confJson.find("level") != confJson.end()) {
        logParam.logLevel = confJson.at("level").get<std::string>();
    }
    if (confJson.find("alsologtostderr") != confJson.end()) {
        logParam.alsoLog2Std = confJson.at("alsologtostderr").get<bool>();
    }
    if (confJson.find("stdLogLevel") != confJson.end()) {
        logParam.stdLogLevel = confJson.at("stdLogLevel").get<std::string>();
    }
}

void ParseLogRolling(const nlohmann::json &confJson, LogsApi::LogParam &logParam)
{
    auto rolling = confJson.find("rolling");
    if (rolling == confJson.end()) {
        return;
    }
    if (rolling->find("maxsize") != rolling->end()) {
        int size = rolling->at("maxsize").get<int>();
        if (size > 0 && size < LogsApi::FILE_SIZE_MAX) {
            logParam.maxSize = size;
        }
    }
    if (rolling->find("maxfiles") != rolling->end()) {
        int files = rolling->at("maxfiles").get<int>();
        if (files > 0 && files < LogsApi::FILES_COUNT_MAX) {
            logParam.maxFiles = static_cast<uint32_t>(files);
        }
    }
}

void ParseLogAsync(const nlohmann::json &confJson, LogsApi::GlobalLogParam &globalLogParam)
{
    auto async = confJson.find("async");
    if (async == confJson.end()) {
        return;
    }
    if (async->find("logBufSecs") != async->end()) {
        int bufSecs = async->at("logBufSecs").get<int>();
        if (bufSecs > 0 && bufSecs <= LogsApi::DEFAULT_LOG_BUF_SECONDS) {
            globalLogParam.logBufSecs = bufSecs;
        }
    }
    if (async->find("maxQueueSize") != async->end()) {
        auto queueSize = async->at("maxQueueSize").get<uint32_t>();
        if (queueSize > 0 && queueSize < LogsApi::MAX_ASYNC_QUEUE_SIZE_MAX) {
            globalLogParam.maxAsyncQueueSize = queueSize;
        }
    }
    if (async->find("threadCount") != async->end()) {
        auto cnt = async->at("threadCount").get<uint32_t>();
        if (cnt > 0 && cnt <= LogsApi::ASYNC_THREAD_COUNT_MAX) {
            globalLogParam.asyncThreadCount = cnt;
        }
    }
}
}  // namespace

std::string GetLogFile(const LogsApi::LogParam &param)
{
    return param.logDir + "/" + param.nodeName + "-" + param.modelName + ".log";
}

LogsApi::LogParam GetLogParam(const std::string &configJsonString, const std::string &nodeName,
                              const std::string &modelName)
{
    LogsApi::LogParam logParam;
    logParam.nodeName = nodeName;
    logParam.modelName = modelName;
    logParam.pattern = "%L%m%d %H:%M:%S.%f %t %s:%#] " + nodeName + "," + modelName + "] %v";
    if (configJsonString.empty()) {
        return logParam;
    }
    try {
        auto confJson = nlohmann::json::parse(configJsonString);
        ParseLogLevel(confJson, logParam);
        ParseLogRolling(confJson, logParam);
    } catch (const nlohmann::json::exception &e) {
        std::cerr << "invalid log config, use default, error: " << e.what() << std::endl;
    }
    return logParam;
}

LogsApi::GlobalLogParam GetGlobalLogParam(const std::string &configJsonString)
{
    LogsApi::GlobalLogParam globalLogParam;
    if (configJsonString.empty()) {
        return globalLogParam;
    }
    try {
        auto confJson = nlohmann::json::parse(configJsonString);
        ParseLogAsync(confJson, globalLogParam);
    } catch (const nlohmann::json::exception &e) {
        std::cerr << "invalid log config, use default, error: " << e.what() << std::endl;
    }
    return globalLogParam;
}

}  // namespace observability::sdk::logs
