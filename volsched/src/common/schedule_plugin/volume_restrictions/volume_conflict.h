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

#ifndef VOLSCHED_VOLUME_CONFLICT_H
#define VOLSCHED_VOLUME_CONFLICT_H

#include <google/protobuf/repeated_field.h>

#include <string>

#include "resource_type.h"
#include "common/resource_view/node_info.h"

namespace volsched::schedule_plugin::volume_restrictions {

using Endpoints = google::protobuf::RepeatedPtrField<std::string>;

/**
 * @brief Whether the two endpoint lists share at least one entry. A lookup set is built from the
 * shorter list and probed with the longer one.
 */
bool HaveOverlap(const Endpoints &lhs, const Endpoints &rhs);

/**
 * @brief Whether the volume is backed by a disk that can be attached to a single node only, so it
 * must be compared with the volumes of the pods already on the node.
 */
bool NeedsRestrictionsCheck(const resource_view::Volume &volume);

/**
 * @brief Whether two volumes refer to the same disk in a way that cannot be shared. Volumes of
 * different backend kinds never conflict.
 *   persistent disk:      same disk name, unless both are read only
 *   elastic block store:  same volume id, read only does not help
 *   iscsi:                same iqn, unless both are read only
 *   rbd:                  overlapping monitors with the same pool and image, unless both are read only
 */
bool IsVolumeConflict(const resource_view::Volume &volume, const resource_view::Volume &existing);

// whether the volume conflicts with any volume of the pod
bool IsVolumeConflict(const resource_view::Volume &volume, const resource_view::Pod &existingPod);

/**
 * @brief Whether none of the restricted volumes of the pod conflicts with the pods on the node.
 */
bool SatisfyVolumeConflicts(const resource_view::Pod &pod, const resource_view::NodeInfo &nodeInfo);

}  // namespace volsched::schedule_plugin::volume_restrictions

#endif  // VOLSCHED_VOLUME_CONFLICT_H
