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

#ifndef VOLSCHED_VOLUME_RESTRICTIONS_PREFILTER_STATE_H
#define VOLSCHED_VOLUME_RESTRICTIONS_PREFILTER_STATE_H

#include <algorithm>
#include <memory>

#include "resource_type.h"
#include "common/scheduler_framework/framework/cycle_state.h"
#include "common/schedule_plugin/volume_restrictions/access_mode_resolver.h"

namespace volsched::schedule_plugin::volume_restrictions {

/**
 * State computed at PreFilter for the pod being scheduled. The claim set is fixed for the attempt and
 * shared between clones, the counter belongs to each copy.
 */
class PreFilterState : public schedule_framework::StateData {
public:
    PreFilterState(const std::shared_ptr<const ClaimNameSet> &readWriteOncePodPVCs, int32_t conflictingPVCRefCount)
        : readWriteOncePodPVCs_(readWriteOncePodPVCs), conflictingPVCRefCount_(conflictingPVCRefCount)
    {
    }
    ~PreFilterState() override = default;

    std::shared_ptr<schedule_framework::StateData> Clone() const override;

    /**
     * @brief Account for a pod that is hypothetically added (multiplier 1) to or removed (multiplier -1)
     * from the cluster.
     */
    void UpdateWithPod(const resource_view::Pod &pod, int32_t multiplier);

    // number of claims of the pod that are ReadWriteOncePod claims of the pod being scheduled
    int32_t ConflictingPVCRefCountForPod(const resource_view::Pod &pod) const;

    // the counter may go below zero while pods of other namespaces are removed and added back
    int32_t GetConflictingPVCRefCount() const
    {
        return std::max(conflictingPVCRefCount_, 0);
    }

    const ClaimNameSet &GetReadWriteOncePodPVCs() const
    {
        return *readWriteOncePodPVCs_;
    }

private:
    std::shared_ptr<const ClaimNameSet> readWriteOncePodPVCs_;
    // number of ReadWriteOncePod claims of the pod that are already used by other pods, unclamped
    int32_t conflictingPVCRefCount_;
};

}  // namespace volsched::schedule_plugin::volume_restrictions

#endif  // VOLSCHED_VOLUME_RESTRICTIONS_PREFILTER_STATE_H
