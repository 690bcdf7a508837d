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

#ifndef COMMON_SCHEDULER_FRAMEWORK_PLUGINS_PLUGIN_FACTROY_H
#define COMMON_SCHEDULER_FRAMEWORK_PLUGINS_PLUGIN_FACTROY_H

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/scheduler_framework/framework/framework_handle.h"
#include "common/scheduler_framework/framework/policy.h"

namespace volsched::schedule_framework {
using PluginCreator =
    std::function<std::shared_ptr<SchedulePolicyPlugin>(const std::shared_ptr<FrameworkHandle> &handle)>;
class PluginFactory {
public:
    static PluginFactory &GetInstance()
    {
        static PluginFactory instance;
        return instance;
    }
    ~PluginFactory() = default;
    PluginFactory(const PluginFactory &) = delete;
    PluginFactory &operator=(const PluginFactory &) = delete;

    // nullptr if no creator is registered under pluginName
    std::shared_ptr<SchedulePolicyPlugin> CreatePlugin(const std::string &pluginName,
                                                       const std::shared_ptr<FrameworkHandle> &handle);
    bool RegisterPluginCreator(const std::string &pluginName, const PluginCreator &gen);
    std::vector<std::string> GetPluginNames();

private:
    PluginFactory() = default;

    std::mutex mutex_;
    std::unordered_map<std::string, PluginCreator> plugins_;
};
}
#endif  // COMMON_SCHEDULER_FRAMEWORK_PLUGINS_PLUGIN_FACTROY_H
