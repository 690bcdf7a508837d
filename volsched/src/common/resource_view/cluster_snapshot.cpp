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

#include "cluster_snapshot.h"

#include <mutex>

#include "logs/logging.h"

namespace volsched::resource_view {

ClusterSnapshot::ClusterSnapshot(const std::vector<Node> &nodes, const std::vector<Pod> &pods)
{
    for (const auto &node : nodes) {
        if (auto status = AddNode(node); status.IsError()) {
            VSLOG_WARN("skip node {}, {}", node.name(), status.ToString());
        }
    }
    for (const auto &pod : pods) {
        if (auto status = AddPod(pod); status.IsError()) {
            VSLOG_WARN("skip pod {}, {}", PodKey(pod), status.ToString());
        }
    }
}

std::vector<std::shared_ptr<NodeInfo>> ClusterSnapshot::List() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::shared_ptr<NodeInfo>> nodeInfos;
    nodeInfos.reserve(nodeOrder_.size());
    for (const auto &name : nodeOrder_) {
        nodeInfos.push_back(nodeInfos_.at(name));
    }
    return nodeInfos;
}

std::shared_ptr<NodeInfo> ClusterSnapshot::Get(const std::string &nodeName) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto iter = nodeInfos_.find(nodeName);
    if (iter == nodeInfos_.end()) {
        return nullptr;
    }
    return iter->second;
}

bool ClusterSnapshot::IsPVCUsedByPods(const std::string &key) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto iter = usedPVCs_.find(key);
    return iter != usedPVCs_.end() && iter->second > 0;
}

Status ClusterSnapshot::AddNode(const Node &node)
{
    if (node.name().empty()) {
        return Status(StatusCode::PARAMETER_ERROR, "node name is empty");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto ret = nodeInfos_.emplace(node.name(), std::make_shared<NodeInfo>(node));
    if (!ret.second) {
        return Status(StatusCode::PARAMETER_ERROR, "duplicate node " + node.name());
    }
    nodeOrder_.push_back(node.name());
    return Status::OK();
}

Status ClusterSnapshot::AddPod(const Pod &pod)
{
    if (pod.node_name().empty()) {
        return Status(StatusCode::PARAMETER_ERROR, "pod " + PodKey(pod) + " is not bound to a node");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto iter = nodeInfos_.find(pod.node_name());
    if (iter == nodeInfos_.end()) {
        return Status(StatusCode::NODE_NOT_FOUND, "node " + pod.node_name() + " not found");
    }
    auto updated = iter->second->Clone();
    updated->AddPod(std::make_shared<const Pod>(pod));
    iter->second = updated;
    UpdateUsedPVCs(pod, 1);
    return Status::OK();
}

Status ClusterSnapshot::RemovePod(const Pod &pod)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto iter = nodeInfos_.find(pod.node_name());
    if (iter == nodeInfos_.end()) {
        return Status(StatusCode::NODE_NOT_FOUND, "node " + pod.node_name() + " not found");
    }
    PodPtr placed = nullptr;
    for (const auto &candidate : iter->second->GetPods()) {
        if (candidate->namespace_() == pod.namespace_() && candidate->name() == pod.name()) {
            placed = candidate;
            break;
        }
    }
    if (placed == nullptr) {
        return Status(StatusCode::PARAMETER_ERROR, "pod " + PodKey(pod) + " is not placed on " + pod.node_name());
    }
    auto updated = iter->second->Clone();
    (void)updated->RemovePod(pod);
    iter->second = updated;
    // the placed copy is what was indexed
    UpdateUsedPVCs(*placed, -1);
    return Status::OK();
}

size_t ClusterSnapshot::NumNodes() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return nodeInfos_.size();
}

void ClusterSnapshot::UpdateUsedPVCs(const Pod &pod, int32_t delta)
{
    for (const auto &volume : pod.volumes()) {
        if (!volume.has_persistent_volume_claim()) {
            continue;
        }
        auto key = GetNamespacedName(pod.namespace_(), volume.persistent_volume_claim().claim_name());
        auto &count = usedPVCs_[key];
        count += delta;
        if (count <= 0) {
            (void)usedPVCs_.erase(key);
        }
    }
}

}  // namespace volsched::resource_view
