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

#include "volume_restrictions.h"

#include "logs/logging.h"
#include "common/schedule_plugin/common/constants.h"
#include "common/schedule_plugin/common/plugin_register.h"
#include "common/schedule_plugin/volume_restrictions/volume_conflict.h"

namespace volsched::schedule_plugin::volume_restrictions {

using resource_view::PersistentVolumeClaim;
using resource_view::Pod;
using resource_view::PodKey;
using schedule_framework::ActionType;
using schedule_framework::EventResource;
using schedule_framework::QueueingHint;
using schedule_framework::QueueingHintResult;

std::string VolumeRestrictions::GetPluginName()
{
    return VOLUME_RESTRICTIONS_NAME;
}

Status VolumeRestrictions::PreFilter(const std::shared_ptr<schedule_framework::CycleState> &state, const Pod &pod)
{
    RETURN_STATUS_IF_NULL(state, StatusCode::POINTER_IS_NULL, "cycle state is null");
    bool needsCheck = false;
    for (const auto &volume : pod.volumes()) {
        if (NeedsRestrictionsCheck(volume)) {
            needsCheck = true;
            break;
        }
    }

    auto pvcs = std::make_shared<ClaimNameSet>();
    auto status = resolver_.ReadWriteOncePodPVCsForPod(pod, false, *pvcs);
    if (status == StatusCode::CLAIM_NOT_FOUND) {
        return Status(StatusCode::UNSCHEDULABLE_AND_UNRESOLVABLE, status.RawMessage());
    }
    RETURN_IF_NOT_OK(status);

    std::shared_ptr<PreFilterState> preFilterState;
    RETURN_IF_NOT_OK(CalPreFilterState(pod, pvcs, preFilterState));

    if (!needsCheck && preFilterState->GetConflictingPVCRefCount() == 0) {
        VSLOG_DEBUG("{}|no restricted volume and no claim in use, VolumeRestrictions does nothing", PodKey(pod));
        return Status(StatusCode::SCHEDULE_SKIP);
    }
    state->Write(VOLUME_RESTRICTIONS_PRE_FILTER_STATE_KEY, preFilterState);
    return Status::OK();
}

Status VolumeRestrictions::AddPod(const std::shared_ptr<schedule_framework::CycleState> &state,
                                  const Pod &podToSchedule, const Pod &podToAdd,
                                  const resource_view::NodeInfo &nodeInfo)
{
    std::shared_ptr<PreFilterState> preFilterState;
    RETURN_IF_NOT_OK(GetPreFilterState(state, preFilterState));
    preFilterState->UpdateWithPod(podToAdd, 1);
    VSLOG_DEBUG("{}|add pod {} on node {}, conflicting claim count {}", PodKey(podToSchedule), PodKey(podToAdd),
                nodeInfo.GetName(), preFilterState->GetConflictingPVCRefCount());
    return Status::OK();
}

Status VolumeRestrictions::RemovePod(const std::shared_ptr<schedule_framework::CycleState> &state,
                                     const Pod &podToSchedule, const Pod &podToRemove,
                                     const resource_view::NodeInfo &nodeInfo)
{
    std::shared_ptr<PreFilterState> preFilterState;
    RETURN_IF_NOT_OK(GetPreFilterState(state, preFilterState));
    preFilterState->UpdateWithPod(podToRemove, -1);
    VSLOG_DEBUG("{}|remove pod {} from node {}, conflicting claim count {}", PodKey(podToSchedule),
                PodKey(podToRemove), nodeInfo.GetName(), preFilterState->GetConflictingPVCRefCount());
    return Status::OK();
}

schedule_framework::Filtered VolumeRestrictions::Filter(const std::shared_ptr<schedule_framework::CycleState> &state,
                                                        const Pod &pod, const resource_view::NodeInfo &nodeInfo)
{
    if (!SatisfyVolumeConflicts(pod, nodeInfo)) {
        return schedule_framework::Filtered{ Status(StatusCode::UNSCHEDULABLE, ERR_REASON_DISK_CONFLICT), false };
    }
    std::shared_ptr<PreFilterState> preFilterState;
    if (auto status = GetPreFilterState(state, preFilterState); status.IsError()) {
        return schedule_framework::Filtered{ status, true };
    }
    if (preFilterState->GetConflictingPVCRefCount() > 0) {
        VSLOG_DEBUG("{}|{} ReadWriteOncePod claims are in use", PodKey(pod),
                    preFilterState->GetConflictingPVCRefCount());
        // resolvable by preempting the pod holding the claim
        return schedule_framework::Filtered{ Status(StatusCode::UNSCHEDULABLE, ERR_REASON_READ_WRITE_ONCE_POD_CONFLICT),
                                             false };
    }
    return schedule_framework::Filtered{ Status::OK(), false };
}

std::vector<schedule_framework::ClusterEventWithHint> VolumeRestrictions::EventsToRegister()
{
    return {
        // Pods may fail to schedule because of volumes conflicting with other pods on same node.
        // Once running pods are deleted and volumes have been released, the unschedulable pod will be schedulable.
        { { EventResource::POD, ActionType::DELETE },
          [this](const Pod &pod, const resource_view::ProtoMessage *oldObj,
                 const resource_view::ProtoMessage *newObj) {
              return IsSchedulableAfterPodDeleted(pod, oldObj, newObj);
          } },
        // A new node may make a pod schedulable.
        { { EventResource::NODE, ActionType::ADD }, nullptr },
        // Pods may fail to schedule because the PVC it uses has not yet been created.
        // This PVC is required to exist to check its access modes.
        { { EventResource::PERSISTENT_VOLUME_CLAIM, ActionType::ADD | ActionType::UPDATE },
          [this](const Pod &pod, const resource_view::ProtoMessage *oldObj,
                 const resource_view::ProtoMessage *newObj) {
              return IsSchedulableAfterPersistentVolumeClaimChange(pod, oldObj, newObj);
          } },
    };
}

QueueingHintResult VolumeRestrictions::IsSchedulableAfterPodDeleted(const Pod &pod,
                                                                    const resource_view::ProtoMessage *oldObj,
                                                                    const resource_view::ProtoMessage *newObj)
{
    const Pod *deletedPod = nullptr;
    const Pod *unused = nullptr;
    if (auto status = schedule_framework::As<Pod>(oldObj, newObj, deletedPod, unused); status.IsError()) {
        return QueueingHintResult{ QueueingHint::QUEUE,
                                   Status(StatusCode::UNEXPECTED_EVENT_PAYLOAD,
                                          "unexpected objects in IsSchedulableAfterPodDeleted: " +
                                              status.RawMessage()) };
    }
    if (deletedPod == nullptr) {
        return QueueingHintResult{ QueueingHint::QUEUE,
                                   Status(StatusCode::UNEXPECTED_EVENT_PAYLOAD,
                                          "unexpected objects in IsSchedulableAfterPodDeleted: deleted pod is null") };
    }

    if (deletedPod->namespace_() != pod.namespace_()) {
        return QueueingHintResult{ QueueingHint::QUEUE_SKIP, Status::OK() };
    }

    ClaimNameSet newPodPvcs;
    auto status = resolver_.ReadWriteOncePodPVCsForPod(pod, false, newPodPvcs);
    if (status == StatusCode::CLAIM_NOT_FOUND) {
        VSLOG_DEBUG("{}|no PVC for the pod is found, it won't be schedulable until the PVC is created, {}",
                    PodKey(pod), status.RawMessage());
        return QueueingHintResult{ QueueingHint::QUEUE_SKIP, Status::OK() };
    }
    if (status.IsError()) {
        return QueueingHintResult{ QueueingHint::QUEUE, status };
    }

    // Claims of the deleted pod may be deleted too. Such a claim is irrelevant: a pod using a claim of the
    // same name waits for it to be created again. The remaining claims may have been released.
    ClaimNameSet deletedPodPvcs;
    status = resolver_.ReadWriteOncePodPVCsForPod(*deletedPod, true, deletedPodPvcs);
    if (status.IsError()) {
        return QueueingHintResult{ QueueingHint::QUEUE, status };
    }

    // the pod may conflict with the deleted pod only through one of these claims
    for (const auto &pvc : deletedPodPvcs) {
        if (newPodPvcs.find(pvc) != newPodPvcs.end()) {
            VSLOG_DEBUG("{}|claim {} is released by deleted pod {}", PodKey(pod), pvc, PodKey(*deletedPod));
            return QueueingHintResult{ QueueingHint::QUEUE, Status::OK() };
        }
    }

    resource_view::NodeInfo nodeInfo(std::vector<resource_view::PodPtr>{ std::make_shared<const Pod>(*deletedPod) });
    if (!SatisfyVolumeConflicts(pod, nodeInfo)) {
        return QueueingHintResult{ QueueingHint::QUEUE, Status::OK() };
    }
    return QueueingHintResult{ QueueingHint::QUEUE_SKIP, Status::OK() };
}

QueueingHintResult VolumeRestrictions::IsSchedulableAfterPersistentVolumeClaimChange(
    const Pod &pod, const resource_view::ProtoMessage *oldObj, const resource_view::ProtoMessage *newObj)
{
    const PersistentVolumeClaim *oldClaim = nullptr;
    const PersistentVolumeClaim *newClaim = nullptr;
    if (auto status = schedule_framework::As<PersistentVolumeClaim>(oldObj, newObj, oldClaim, newClaim);
        status.IsError()) {
        return QueueingHintResult{ QueueingHint::QUEUE,
                                   Status(StatusCode::UNEXPECTED_EVENT_PAYLOAD,
                                          "unexpected objects in IsSchedulableAfterPersistentVolumeClaimChange: " +
                                              status.RawMessage()) };
    }
    // an update never creates a claim the pod is waiting for
    if (oldClaim != nullptr) {
        return QueueingHintResult{ QueueingHint::QUEUE_SKIP, Status::OK() };
    }
    if (newClaim == nullptr) {
        return QueueingHintResult{
            QueueingHint::QUEUE,
            Status(StatusCode::UNEXPECTED_EVENT_PAYLOAD,
                   "unexpected objects in IsSchedulableAfterPersistentVolumeClaimChange: created claim is null")
        };
    }
    if (newClaim->namespace_() != pod.namespace_()) {
        return QueueingHintResult{ QueueingHint::QUEUE_SKIP, Status::OK() };
    }

    ClaimNameSet pvcs;
    auto status = resolver_.ReferencedPVCsForPod(pod, pvcs);
    if (status == StatusCode::CLAIM_NOT_FOUND) {
        VSLOG_DEBUG("{}|the PVC for the pod is not created, it won't be schedulable until the PVC is created, {}",
                    PodKey(pod), status.RawMessage());
        return QueueingHintResult{ QueueingHint::QUEUE_SKIP, Status::OK() };
    }
    if (status.IsError()) {
        return QueueingHintResult{ QueueingHint::QUEUE, status };
    }

    // only the claims the pod requests are of interest
    if (pvcs.find(newClaim->name()) != pvcs.end()) {
        return QueueingHintResult{ QueueingHint::QUEUE, Status::OK() };
    }
    return QueueingHintResult{ QueueingHint::QUEUE_SKIP, Status::OK() };
}

Status VolumeRestrictions::CalPreFilterState(const Pod &pod, const std::shared_ptr<const ClaimNameSet> &pvcs,
                                             std::shared_ptr<PreFilterState> &preFilterState) const
{
    RETURN_STATUS_IF_NULL(storageInfoLister_, StatusCode::POINTER_IS_NULL, "storage info lister is null");
    int32_t conflictingPVCRefCount = 0;
    for (const auto &pvc : *pvcs) {
        if (storageInfoLister_->IsPVCUsedByPods(resource_view::GetNamespacedName(pod.namespace_(), pvc))) {
            conflictingPVCRefCount++;
        }
    }
    preFilterState = std::make_shared<PreFilterState>(pvcs, conflictingPVCRefCount);
    return Status::OK();
}

Status VolumeRestrictions::GetPreFilterState(const std::shared_ptr<schedule_framework::CycleState> &state,
                                             std::shared_ptr<PreFilterState> &preFilterState) const
{
    RETURN_STATUS_IF_NULL(state, StatusCode::POINTER_IS_NULL, "cycle state is null");
    auto status = schedule_framework::ReadState(*state, VOLUME_RESTRICTIONS_PRE_FILTER_STATE_KEY, preFilterState);
    if (status.IsError()) {
        VSLOG_ERROR("failed to read prefilter state of VolumeRestrictions, {}", status.ToString());
    }
    return status;
}

std::shared_ptr<schedule_framework::SchedulePolicyPlugin> VolumeRestrictionsCreator(
    const std::shared_ptr<schedule_framework::FrameworkHandle> &handle)
{
    if (handle == nullptr) {
        VSLOG_ERROR("failed to create plugin {}, framework handle is null", VOLUME_RESTRICTIONS_NAME);
        return nullptr;
    }
    return std::make_shared<VolumeRestrictions>(handle->GetClaimLister(), handle->SnapshotSharedLister());
}

REGISTER_SCHEDULER_PLUGIN(VOLUME_RESTRICTIONS_NAME, VolumeRestrictionsCreator);
}  // namespace volsched::schedule_plugin::volume_restrictions
