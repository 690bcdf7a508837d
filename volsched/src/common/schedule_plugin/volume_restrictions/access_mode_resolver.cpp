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

#include "access_mode_resolver.h"

#include <algorithm>

#include "logs/logging.h"

namespace volsched::schedule_plugin::volume_restrictions {

bool HasAccessMode(const resource_view::PersistentVolumeClaim &claim, resource_view::AccessMode mode)
{
    return std::find(claim.access_modes().begin(), claim.access_modes().end(), mode) != claim.access_modes().end();
}

Status AccessModeResolver::ReadWriteOncePodPVCsForPod(const resource_view::Pod &pod, bool ignoreNotFound,
                                                      ClaimNameSet &claims) const
{
    RETURN_STATUS_IF_NULL(claimLister_, StatusCode::POINTER_IS_NULL, "claim lister is null");
    for (const auto &volume : pod.volumes()) {
        if (!volume.has_persistent_volume_claim()) {
            continue;
        }
        const auto &claimName = volume.persistent_volume_claim().claim_name();
        resource_view::PersistentVolumeClaim claim;
        auto status = claimLister_->Get(pod.namespace_(), claimName, claim);
        if (status == StatusCode::CLAIM_NOT_FOUND && ignoreNotFound) {
            VSLOG_DEBUG("{}|claim {} not found, ignored", resource_view::PodKey(pod), claimName);
            continue;
        }
        RETURN_IF_NOT_OK(status);
        if (HasAccessMode(claim, resource_view::AccessMode::READ_WRITE_ONCE_POD)) {
            (void)claims.insert(claimName);
        }
    }
    return Status::OK();
}

Status AccessModeResolver::ReferencedPVCsForPod(const resource_view::Pod &pod, ClaimNameSet &claims) const
{
    RETURN_STATUS_IF_NULL(claimLister_, StatusCode::POINTER_IS_NULL, "claim lister is null");
    for (const auto &volume : pod.volumes()) {
        if (!volume.has_persistent_volume_claim()) {
            continue;
        }
        const auto &claimName = volume.persistent_volume_claim().claim_name();
        resource_view::PersistentVolumeClaim claim;
        RETURN_IF_NOT_OK(claimLister_->Get(pod.namespace_(), claimName, claim));
        (void)claims.insert(claimName);
    }
    return Status::OK();
}

}  // namespace volsched::schedule_plugin::volume_restrictions
