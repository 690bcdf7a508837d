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

#ifndef VOLSCHED_VOLUME_RESTRICTIONS_H
#define VOLSCHED_VOLUME_RESTRICTIONS_H

#include <memory>
#include <string>
#include <vector>

#include "resource_type.h"
#include "common/resource_view/shared_lister.h"
#include "common/scheduler_framework/framework/framework_handle.h"
#include "common/scheduler_framework/framework/policy.h"
#include "common/schedule_plugin/volume_restrictions/access_mode_resolver.h"
#include "common/schedule_plugin/volume_restrictions/prefilter_state.h"
#include "status/status.h"

namespace volsched::schedule_plugin::volume_restrictions {

/**
 * Rejects nodes where a volume of the pod would conflict with a volume already mounted there, and pods
 * whose ReadWriteOncePod claims are already used by another pod.
 */
class VolumeRestrictions : public schedule_framework::PreFilterPlugin,
                           public schedule_framework::FilterPlugin,
                           public schedule_framework::EnqueueExtensions,
                           public schedule_framework::PreFilterExtensions {
public:
    VolumeRestrictions(const std::shared_ptr<resource_view::ClaimLister> &claimLister,
                       const std::shared_ptr<resource_view::StorageInfoLister> &storageInfoLister)
        : resolver_(claimLister), storageInfoLister_(storageInfoLister)
    {
    }
    ~VolumeRestrictions() override = default;

    std::string GetPluginName() override;

    /**
     * Resolve the ReadWriteOncePod claims of the pod and count those already in use.
     * @return Status: SCHEDULE_SKIP if the pod has neither restricted volumes nor claims in use,
     * UNSCHEDULABLE_AND_UNRESOLVABLE if a claim of the pod does not exist.
     */
    Status PreFilter(const std::shared_ptr<schedule_framework::CycleState> &state,
                     const resource_view::Pod &pod) override;

    schedule_framework::PreFilterExtensions *GetPreFilterExtensions() override
    {
        return this;
    }

    Status AddPod(const std::shared_ptr<schedule_framework::CycleState> &state,
                  const resource_view::Pod &podToSchedule, const resource_view::Pod &podToAdd,
                  const resource_view::NodeInfo &nodeInfo) override;

    Status RemovePod(const std::shared_ptr<schedule_framework::CycleState> &state,
                     const resource_view::Pod &podToSchedule, const resource_view::Pod &podToRemove,
                     const resource_view::NodeInfo &nodeInfo) override;

    schedule_framework::Filtered Filter(const std::shared_ptr<schedule_framework::CycleState> &state,
                                        const resource_view::Pod &pod,
                                        const resource_view::NodeInfo &nodeInfo) override;

    std::vector<schedule_framework::ClusterEventWithHint> EventsToRegister() override;

    /**
     * @brief Whether the deletion of a pod may release a volume the pod is waiting for.
     * @param oldObj The deleted pod.
     */
    schedule_framework::QueueingHintResult IsSchedulableAfterPodDeleted(const resource_view::Pod &pod,
                                                                        const resource_view::ProtoMessage *oldObj,
                                                                        const resource_view::ProtoMessage *newObj);

    /**
     * @brief Whether a claim the pod is waiting for has been created.
     * @param oldObj The claim before an update, null when the claim is created.
     * @param newObj The created or updated claim.
     */
    schedule_framework::QueueingHintResult IsSchedulableAfterPersistentVolumeClaimChange(
        const resource_view::Pod &pod, const resource_view::ProtoMessage *oldObj,
        const resource_view::ProtoMessage *newObj);

private:
    Status CalPreFilterState(const resource_view::Pod &pod, const std::shared_ptr<const ClaimNameSet> &pvcs,
                             std::shared_ptr<PreFilterState> &preFilterState) const;
    Status GetPreFilterState(const std::shared_ptr<schedule_framework::CycleState> &state,
                             std::shared_ptr<PreFilterState> &preFilterState) const;

    AccessModeResolver resolver_;
    std::shared_ptr<resource_view::StorageInfoLister> storageInfoLister_;
};

std::shared_ptr<schedule_framework::SchedulePolicyPlugin> VolumeRestrictionsCreator(
    const std::shared_ptr<schedule_framework::FrameworkHandle> &handle);

}  // namespace volsched::schedule_plugin::volume_restrictions

#endif  // VOLSCHED_VOLUME_RESTRICTIONS_H
