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

#ifndef COMMON_RESOURCE_VIEW_SHARED_LISTER_H
#define COMMON_RESOURCE_VIEW_SHARED_LISTER_H

#include <memory>
#include <string>
#include <vector>

#include "common/resource_view/node_info.h"

namespace volsched::resource_view {

class NodeInfoLister {
public:
    NodeInfoLister() = default;
    virtual ~NodeInfoLister() = default;
    virtual std::vector<std::shared_ptr<NodeInfo>> List() const = 0;
    // nullptr if the node is unknown
    virtual std::shared_ptr<NodeInfo> Get(const std::string &nodeName) const = 0;
};

class StorageInfoLister {
public:
    StorageInfoLister() = default;
    virtual ~StorageInfoLister() = default;
    /**
     * @brief Whether some placed pod references the claim.
     * @param key namespace/name of the claim, see GetNamespacedName.
     */
    virtual bool IsPVCUsedByPods(const std::string &key) const = 0;
};

class SharedLister : public NodeInfoLister, public StorageInfoLister {
public:
    SharedLister() = default;
    ~SharedLister() override = default;
};

}  // namespace volsched::resource_view

#endif  // COMMON_RESOURCE_VIEW_SHARED_LISTER_H
