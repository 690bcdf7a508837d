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

#ifndef COMMON_RESOURCE_VIEW_RESOURCE_TYPE_H
#define COMMON_RESOURCE_VIEW_RESOURCE_TYPE_H

#include <google/protobuf/message.h>

#include <string>

#include "proto/volume.pb.h"

namespace volsched::resource_view {
using Volume = ::cluster::Volume;
using VolumeSourceCase = ::cluster::Volume::SourceCase;
using PersistentDiskSource = ::cluster::PersistentDiskSource;
using ElasticBlockStoreSource = ::cluster::ElasticBlockStoreSource;
using IscsiSource = ::cluster::IscsiSource;
using RbdSource = ::cluster::RbdSource;
using ClaimSource = ::cluster::ClaimSource;
using Pod = ::cluster::Pod;
using PersistentVolumeClaim = ::cluster::PersistentVolumeClaim;
using AccessMode = ::cluster::AccessMode;
using Node = ::cluster::Node;
using ProtoMessage = ::google::protobuf::Message;

inline std::string GetNamespacedName(const std::string &ns, const std::string &name)
{
    return ns + "/" + name;
}

inline std::string PodKey(const Pod &pod)
{
    return GetNamespacedName(pod.namespace_(), pod.name());
}

}  // namespace volsched::resource_view

#endif  // COMMON_RESOURCE_VIEW_RESOURCE_TYPE_H
