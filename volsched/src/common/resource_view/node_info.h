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

#ifndef COMMON_RESOURCE_VIEW_NODE_INFO_H
#define COMMON_RESOURCE_VIEW_NODE_INFO_H

#include <memory>
#include <string>
#include <vector>

#include "resource_type.h"

namespace volsched::resource_view {

using PodPtr = std::shared_ptr<const Pod>;

/**
 * A node together with the pods placed on it, in placement order.
 */
class NodeInfo {
public:
    NodeInfo() = default;
    explicit NodeInfo(const Node &node) : node_(node) {}
    // a node without identity holding the given pods
    explicit NodeInfo(const std::vector<PodPtr> &pods) : pods_(pods) {}
    ~NodeInfo() = default;

    const Node &GetNode() const
    {
        return node_;
    }

    const std::string &GetName() const
    {
        return node_.name();
    }

    const std::vector<PodPtr> &GetPods() const
    {
        return pods_;
    }

    void AddPod(const PodPtr &pod);

    /**
     * @brief Remove the pod with the same namespace and name.
     * @return false if no such pod is placed on the node.
     */
    bool RemovePod(const Pod &pod);

    // pods are shared with the copy, the pod list is not
    std::shared_ptr<NodeInfo> Clone() const;

private:
    Node node_;
    std::vector<PodPtr> pods_;
};

}  // namespace volsched::resource_view

#endif  // COMMON_RESOURCE_VIEW_NODE_INFO_H
