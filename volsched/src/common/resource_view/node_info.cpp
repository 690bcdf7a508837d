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

#include "node_info.h"

#include <algorithm>

namespace volsched::resource_view {

void NodeInfo::AddPod(const PodPtr &pod)
{
    if (pod == nullptr) {
        return;
    }
    pods_.push_back(pod);
}

bool NodeInfo::RemovePod(const Pod &pod)
{
    auto iter = std::find_if(pods_.begin(), pods_.end(), [&pod](const PodPtr &placed) {
        return placed->namespace_() == pod.namespace_() && placed->name() == pod.name();
    });
    if (iter == pods_.end()) {
        return false;
    }
    (void)pods_.erase(iter);
    return true;
}

std::shared_ptr<NodeInfo> NodeInfo::Clone() const
{
    auto cloned = std::make_shared<NodeInfo>(node_);
    cloned->pods_ = pods_;
    return cloned;
}

}  // namespace volsched::resource_view
