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

#include "plugin_config.h"

#include <nlohmann/json.hpp>

#include "logs/logging.h"
#include "common/schedule_plugin/common/plugin_factory.h"

namespace volsched::schedule_framework {

Status RegisterPolicy(const std::shared_ptr<Framework> &framework, const std::shared_ptr<FrameworkHandle> &handle,
                      const std::string &policyName)
{
    RETURN_STATUS_IF_NULL(framework, StatusCode::POINTER_IS_NULL, "schedule framework nullptr");
    auto plugin = PluginFactory::GetInstance().CreatePlugin(policyName, handle);
    RETURN_STATUS_IF_NULL(plugin, StatusCode::PLUGIN_REGISTER_ERROR, "invalid policy " + policyName + ", not found");
    if (!framework->RegisterPolicy(plugin)) {
        VSLOG_WARN("{} schedule policy may duplicated", policyName);
        return Status(StatusCode::PLUGIN_REGISTER_ERROR, "duplicated schedule policy " + policyName);
    }
    return Status::OK();
}

Status RegisterPolicies(const std::shared_ptr<Framework> &framework, const std::shared_ptr<FrameworkHandle> &handle,
                        const std::string &schedulePlugins)
{
    VSLOG_DEBUG("start to RegisterPolicy, plugins: {}", schedulePlugins);
    nlohmann::json plugins;
    try {
        plugins = nlohmann::json::parse(schedulePlugins);
    } catch (nlohmann::json::parse_error &e) {
        VSLOG_ERROR("failed to register policy, not a valid json");
        return Status(StatusCode::PARAMETER_ERROR, "failed to register policy, not a valid json, reason: " +
                                                       std::string(e.what()) + ", id: " + std::to_string(e.id));
    }

    if (!plugins.is_array()) {
        VSLOG_ERROR("failed to register policy, invalid format");
        return Status(StatusCode::PARAMETER_ERROR, "failed to register policy, invalid format");
    }
    for (const auto &plugin : plugins) {
        if (!plugin.is_string()) {
            VSLOG_ERROR("failed to register policy, plugin name {} is not a string", plugin.dump());
            return Status(StatusCode::PARAMETER_ERROR, "failed to register policy, invalid plugin " + plugin.dump());
        }
    }
    Status result = Status::OK();
    for (const auto &plugin : plugins) {
        auto pluginName = plugin.get<std::string>();
        if (auto status = RegisterPolicy(framework, handle, pluginName); status.IsError()) {
            VSLOG_WARN("failed to register {} policy, error: {}", pluginName, status.ToString());
            if (result.IsOk()) {
                result = Status(StatusCode::PLUGIN_REGISTER_ERROR, "failed to register policy");
            }
            result.AppendMessage(status.RawMessage());
        }
    }
    return result;
}

}  // namespace volsched::schedule_framework
