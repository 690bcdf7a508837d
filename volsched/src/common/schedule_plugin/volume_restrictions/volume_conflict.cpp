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

#include "volume_conflict.h"

#include <unordered_set>

#include "logs/logging.h"

namespace volsched::schedule_plugin::volume_restrictions {

using resource_view::Volume;

bool HaveOverlap(const Endpoints &lhs, const Endpoints &rhs)
{
    const auto &shorter = lhs.size() > rhs.size() ? rhs : lhs;
    const auto &longer = lhs.size() > rhs.size() ? lhs : rhs;
    std::unordered_set<std::string> lookup(shorter.begin(), shorter.end());
    for (const auto &endpoint : longer) {
        if (lookup.find(endpoint) != lookup.end()) {
            return true;
        }
    }
    return false;
}

bool NeedsRestrictionsCheck(const Volume &volume)
{
    switch (volume.source_case()) {
        case Volume::kPersistentDisk:
        case Volume::kElasticBlockStore:
        case Volume::kIscsi:
        case Volume::kRbd:
            return true;
        default:
            return false;
    }
}

bool IsVolumeConflict(const Volume &volume, const Volume &existing)
{
    if (volume.source_case() != existing.source_case()) {
        return false;
    }
    switch (volume.source_case()) {
        case Volume::kPersistentDisk: {
            const auto &disk = volume.persistent_disk();
            const auto &other = existing.persistent_disk();
            return disk.disk_name() == other.disk_name() && !(disk.read_only() && other.read_only());
        }
        case Volume::kElasticBlockStore:
            return volume.elastic_block_store().volume_id() == existing.elastic_block_store().volume_id();
        case Volume::kIscsi: {
            const auto &target = volume.iscsi();
            const auto &other = existing.iscsi();
            return target.iqn() == other.iqn() && !(target.read_only() && other.read_only());
        }
        case Volume::kRbd: {
            const auto &image = volume.rbd();
            const auto &other = existing.rbd();
            return HaveOverlap(image.monitors(), other.monitors()) && image.pool() == other.pool() &&
                   image.image() == other.image() && !(image.read_only() && other.read_only());
        }
        default:
            return false;
    }
}

bool IsVolumeConflict(const Volume &volume, const resource_view::Pod &existingPod)
{
    for (const auto &existing : existingPod.volumes()) {
        if (IsVolumeConflict(volume, existing)) {
            return true;
        }
    }
    return false;
}

bool SatisfyVolumeConflicts(const resource_view::Pod &pod, const resource_view::NodeInfo &nodeInfo)
{
    for (const auto &volume : pod.volumes()) {
        if (!NeedsRestrictionsCheck(volume)) {
            continue;
        }
        for (const auto &existingPod : nodeInfo.GetPods()) {
            if (IsVolumeConflict(volume, *existingPod)) {
                VSLOG_DEBUG("volume {} of pod {} conflicts with pod {} on node {}", volume.name(),
                            resource_view::PodKey(pod), resource_view::PodKey(*existingPod), nodeInfo.GetName());
                return false;
            }
        }
    }
    return true;
}

}  // namespace volsched::schedule_plugin::volume_restrictions
