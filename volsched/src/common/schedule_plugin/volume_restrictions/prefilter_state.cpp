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

#include "prefilter_state.h"

namespace volsched::schedule_plugin::volume_restrictions {

std::shared_ptr<schedule_framework::StateData> PreFilterState::Clone() const
{
    return std::make_shared<PreFilterState>(readWriteOncePodPVCs_, conflictingPVCRefCount_);
}

void PreFilterState::UpdateWithPod(const resource_view::Pod &pod, int32_t multiplier)
{
    conflictingPVCRefCount_ += multiplier * ConflictingPVCRefCountForPod(pod);
}

int32_t PreFilterState::ConflictingPVCRefCountForPod(const resource_view::Pod &pod) const
{
    int32_t conflictingPVCRefCount = 0;
    for (const auto &volume : pod.volumes()) {
        if (!volume.has_persistent_volume_claim()) {
            continue;
        }
        if (readWriteOncePodPVCs_->find(volume.persistent_volume_claim().claim_name()) !=
            readWriteOncePodPVCs_->end()) {
            conflictingPVCRefCount++;
        }
    }
    return conflictingPVCRefCount;
}

}  // namespace volsched::schedule_plugin::volume_restrictions
