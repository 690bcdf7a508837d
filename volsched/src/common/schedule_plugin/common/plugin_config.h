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

#ifndef COMMON_SCHEDULER_FRAMEWORK_PLUGINS_PLUGIN_CONFIG_H
#define COMMON_SCHEDULER_FRAMEWORK_PLUGINS_PLUGIN_CONFIG_H

#include <memory>
#include <string>

#include "common/scheduler_framework/framework/framework.h"
#include "common/scheduler_framework/framework/framework_handle.h"
#include "status/status.h"

namespace volsched::schedule_framework {

/**
 * @brief Create the plugin registered under policyName and register it to the framework.
 * @return PLUGIN_REGISTER_ERROR if the plugin is unknown or already registered.
 */
Status RegisterPolicy(const std::shared_ptr<Framework> &framework, const std::shared_ptr<FrameworkHandle> &handle,
                      const std::string &policyName);

/**
 * @brief Register the plugins enabled by configuration, e.g. ["VolumeRestrictions"].
 * @param schedulePlugins JSON array of plugin names.
 * @return PARAMETER_ERROR if schedulePlugins is not a JSON array of strings, PLUGIN_REGISTER_ERROR if some
 * plugin could not be registered. The other plugins are registered anyway.
 */
Status RegisterPolicies(const std::shared_ptr<Framework> &framework, const std::shared_ptr<FrameworkHandle> &handle,
                        const std::string &schedulePlugins);

}  // namespace volsched::schedule_framework

#endif  // COMMON_SCHEDULER_FRAMEWORK_PLUGINS_PLUGIN_CONFIG_H
