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

#ifndef COMMON_SCHEDULER_FRAMEWORK_PLUGINS_PLUGIN_REGISTER_H
#define COMMON_SCHEDULER_FRAMEWORK_PLUGINS_PLUGIN_REGISTER_H

#include "common/schedule_plugin/common/plugin_factory.h"

namespace volsched::schedule_framework {
/**
 * Registers a plugin creator to the PluginFactory while the plugin's translation unit is statically
 * initialized. A second creator under the same name is refused and the first one is kept.
 */
class PluginRegister {
public:
    PluginRegister(const std::string &pluginName, const PluginCreator &gen) noexcept
        : registered_(PluginFactory::GetInstance().RegisterPluginCreator(pluginName, gen))
    {
    }
    ~PluginRegister() = default;

    bool IsRegistered() const
    {
        return registered_;
    }

private:
    bool registered_;
};

// no logger is installed yet when the registration runs
#define REGISTER_SCHEDULER_PLUGIN(pluginName, gen)                                         \
    namespace {                                                                            \
    const schedule_framework::PluginRegister g_##gen##Register(pluginName, gen);           \
    }

}  // namespace volsched::schedule_framework

#endif  // COMMON_SCHEDULER_FRAMEWORK_PLUGINS_PLUGIN_REGISTER_H
