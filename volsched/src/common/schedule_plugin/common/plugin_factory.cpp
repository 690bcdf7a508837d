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

#include "plugin_factory.h"

#include <algorithm>

#include "logs/logging.h"

namespace volsched::schedule_framework {

std::shared_ptr<SchedulePolicyPlugin> PluginFactory::CreatePlugin(const std::string &pluginName,
                                                                  const std::shared_ptr<FrameworkHandle> &handle)
{
    VSLOG_DEBUG("create scheduler plugin {}", pluginName);
    PluginCreator creator;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto iter = plugins_.find(pluginName);
        if (iter == plugins_.end()) {
            return nullptr;
        }
        creator = iter->second;
    }
    return creator(handle);
}

bool PluginFactory::RegisterPluginCreator(const std::string &pluginName, const PluginCreator &gen)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto ret = plugins_.emplace(pluginName, gen);
    if (!ret.second) {
        VSLOG_ERROR("failed to register plugin creator {}", pluginName);
    }
    return ret.second;
}

std::vector<std::string> PluginFactory::GetPluginNames()
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(plugins_.size());
    for (const auto &pair : plugins_) {
        names.push_back(pair.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace volsched::schedule_framework
