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

#ifndef VOLSCHED_TEST_PLUGIN_UTILS_H
#define VOLSCHED_TEST_PLUGIN_UTILS_H

#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

#include "resource_type.h"
#include "common/resource_view/node_info.h"

namespace volsched::test::schedule_plugin {
using std::string;
using std::vector;

inline resource_view::Volume GetPersistentDiskVolume(const string &diskName, bool readOnly)
{
    resource_view::Volume volume;
    volume.set_name("pd-" + diskName);
    volume.mutable_persistent_disk()->set_disk_name(diskName);
    volume.mutable_persistent_disk()->set_read_only(readOnly);
    return volume;
}

inline resource_view::Volume GetElasticBlockStoreVolume(const string &volumeId)
{
    resource_view::Volume volume;
    volume.set_name("ebs-" + volumeId);
    volume.mutable_elastic_block_store()->set_volume_id(volumeId);
    return volume;
}

inline resource_view::Volume GetIscsiVolume(const string &iqn, bool readOnly)
{
    resource_view::Volume volume;
    volume.set_name("iscsi-" + iqn);
    volume.mutable_iscsi()->set_iqn(iqn);
    volume.mutable_iscsi()->set_read_only(readOnly);
    return volume;
}

inline resource_view::Volume GetRbdVolume(std::initializer_list<string> monitors, const string &pool,
                                          const string &image, bool readOnly)
{
    resource_view::Volume volume;
    volume.set_name("rbd-" + pool + "-" + image);
    auto rbd = volume.mutable_rbd();
    for (const auto &monitor : monitors) {
        rbd->add_monitors(monitor);
    }
    rbd->set_pool(pool);
    rbd->set_image(image);
    rbd->set_read_only(readOnly);
    return volume;
}

inline resource_view::Volume GetClaimVolume(const string &claimName)
{
    resource_view::Volume volume;
    volume.set_name("pvc-" + claimName);
    volume.mutable_persistent_volume_claim()->set_claim_name(claimName);
    return volume;
}

inline resource_view::Volume GetHostPathVolume(const string &path)
{
    resource_view::Volume volume;
    volume.set_name("host-path");
    volume.mutable_host_path()->set_path(path);
    return volume;
}

inline resource_view::Pod GetPod(const string &ns, const string &name, const vector<resource_view::Volume> &volumes,
                                 const string &nodeName = "")
{
    resource_view::Pod pod;
    pod.set_namespace_(ns);
    pod.set_name(name);
    pod.set_uid(ns + "-" + name);
    pod.set_node_name(nodeName);
    for (const auto &volume : volumes) {
        *pod.add_volumes() = volume;
    }
    return pod;
}

inline resource_view::PersistentVolumeClaim GetClaim(const string &ns, const string &name,
                                                     std::initializer_list<resource_view::AccessMode> modes)
{
    resource_view::PersistentVolumeClaim claim;
    claim.set_namespace_(ns);
    claim.set_name(name);
    for (auto mode : modes) {
        claim.add_access_modes(mode);
    }
    return claim;
}

inline resource_view::Node GetNode(const string &name)
{
    resource_view::Node node;
    node.set_name(name);
    return node;
}

inline resource_view::NodeInfo GetNodeInfo(const string &name, const vector<resource_view::Pod> &pods)
{
    resource_view::NodeInfo nodeInfo(GetNode(name));
    for (const auto &pod : pods) {
        nodeInfo.AddPod(std::make_shared<const resource_view::Pod>(pod));
    }
    return nodeInfo;
}

}  // namespace volsched::test::schedule_plugin

#endif  // VOLSCHED_TEST_PLUGIN_UTILS_H
