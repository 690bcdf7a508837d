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

#include <gtest/gtest.h>

#include <iostream>
#include <memory>

#include "logs/logging.h"
#include "logs/sdk/log_param_parser.h"
#include "logs/sdk/logger_provider.h"

const std::string NODE_NAME = "node";
const std::string MODEL_NAME = "volsched_unit_test";
const std::string LOG_CONFIG_JSON = R"(
{
  "filepath": ".",
  "level": "DEBUG",
  "rolling": {
    "maxsize": 100,
    "maxfiles": 1
  },
  "async": {
    "logBufSecs": 30,
    "maxQueueSize": 1048510,
    "threadCount": 1
  },
  "alsologtostderr": true,
  "stdLogLevel": "ERROR"
}
)";

namespace LogsSdk = observability::sdk::logs;
namespace LogsApi = observability::api::logs;

int main(int argc, char **argv)
{
    testing::InitGoogleTest(&argc, argv);

    auto globalParam = LogsSdk::GetGlobalLogParam(LOG_CONFIG_JSON);
    auto param = LogsSdk::GetLogParam(LOG_CONFIG_JSON, NODE_NAME, MODEL_NAME);
    auto lp = std::make_shared<LogsSdk::LoggerProvider>(globalParam);
    if (lp->CreateLogger(param) == nullptr) {
        std::cerr << "failed to create logger, run without logs" << std::endl;
    }
    LogsApi::Provider::SetLoggerProvider(lp);
    VSLOG_INFO("start {}", MODEL_NAME);

    int code = RUN_ALL_TESTS();
    (void)lp->ForceFlush();
    LogsApi::Provider::SetLoggerProvider(std::make_shared<LogsApi::NullLoggerProvider>());
    return code;
}
