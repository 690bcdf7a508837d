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

#include "cycle_state.h"

#include <mutex>

namespace volsched::schedule_framework {

void CycleState::Write(const std::string &key, const std::shared_ptr<StateData> &data)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    storage_[key] = data;
}

Status CycleState::Read(const std::string &key, std::shared_ptr<StateData> &data) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto iter = storage_.find(key);
    if (iter == storage_.end() || iter->second == nullptr) {
        return Status(StatusCode::STATE_NOT_FOUND, "reading \"" + key + "\" from cycle state");
    }
    data = iter->second;
    return Status::OK();
}

void CycleState::Delete(const std::string &key)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    (void)storage_.erase(key);
}

std::shared_ptr<CycleState> CycleState::Clone() const
{
    auto cloned = std::make_shared<CycleState>();
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto &[key, data] : storage_) {
        cloned->storage_.emplace(key, data == nullptr ? nullptr : data->Clone());
    }
    cloned->skipFilterPlugins_ = skipFilterPlugins_;
    return cloned;
}

void CycleState::SetSkipFilterPlugins(const std::set<std::string> &plugins)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    skipFilterPlugins_ = plugins;
}

bool CycleState::IsFilterPluginSkipped(const std::string &name) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return skipFilterPlugins_.find(name) != skipFilterPlugins_.end();
}

std::set<std::string> CycleState::GetSkipFilterPlugins() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return skipFilterPlugins_;
}

}  // namespace volsched::schedule_framework
