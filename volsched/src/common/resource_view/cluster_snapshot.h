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

#ifndef COMMON_RESOURCE_VIEW_CLUSTER_SNAPSHOT_H
#define COMMON_RESOURCE_VIEW_CLUSTER_SNAPSHOT_H

#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/resource_view/shared_lister.h"
#include "status/status.h"

namespace volsched::resource_view {

/**
 * Point-in-time view of pod placement used during a scheduling cycle. Besides the nodes it keeps a
 * reference-counted index of every claim referenced by a placed pod, so that claim usage is answered
 * without walking the nodes.
 * A NodeInfo returned by Get or List is never modified afterwards: AddPod and RemovePod replace the node's
 * NodeInfo with an updated copy, so a scheduling attempt keeps a stable view of the nodes it listed.
 */
class ClusterSnapshot : public SharedLister {
public:
    ClusterSnapshot() = default;
    // pods bound to unknown nodes are skipped
    ClusterSnapshot(const std::vector<Node> &nodes, const std::vector<Pod> &pods);
    ~ClusterSnapshot() override = default;

    std::vector<std::shared_ptr<NodeInfo>> List() const override;
    std::shared_ptr<NodeInfo> Get(const std::string &nodeName) const override;
    bool IsPVCUsedByPods(const std::string &key) const override;

    Status AddNode(const Node &node);

    /**
     * @brief Place a pod on the node named by its node_name and index its claims.
     * @return PARAMETER_ERROR if the pod is not bound, NODE_NOT_FOUND if its node is unknown.
     */
    Status AddPod(const Pod &pod);

    Status RemovePod(const Pod &pod);

    size_t NumNodes() const;

private:
    void UpdateUsedPVCs(const Pod &pod, int32_t delta);

    mutable std::shared_mutex mutex_;
    // node names in insertion order
    std::vector<std::string> nodeOrder_;
    std::unordered_map<std::string, std::shared_ptr<NodeInfo>> nodeInfos_;
    // key: namespace/claim, value: number of placed pods referencing it
    std::unordered_map<std::string, int32_t> usedPVCs_;
};

}  // namespace volsched::resource_view

#endif  // COMMON_RESOURCE_VIEW_CLUSTER_SNAPSHOT_H
