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
#ifndef SCHEDULER_FRAMEWORK_H
#define SCHEDULER_FRAMEWORK_H

#include <memory>
#include <string>
#include <vector>

#include "resource_type.h"
#include "common/resource_view/node_info.h"
#include "common/scheduler_framework/framework/policy.h"
#include "status/status.h"

namespace volsched::schedule_framework {

struct ScheduleResults {
    int32_t code;
    std::string reason;
    // names of the feasible nodes, in the order they were filtered
    std::vector<std::string> feasibleNodes;
};

class Framework {
public:
    Framework() = default;
    virtual ~Framework() = default;
    virtual bool RegisterPolicy(const std::shared_ptr<SchedulePolicyPlugin> &plugin) = 0;
    virtual bool UnRegisterPolicy(const std::string &name) = 0;

    virtual Status RunPreFilterPlugins(const std::shared_ptr<CycleState> &state, const resource_view::Pod &pod) = 0;
    virtual Filtered RunFilterPlugins(const std::shared_ptr<CycleState> &state, const resource_view::Pod &pod,
                                      const resource_view::NodeInfo &nodeInfo) = 0;
    virtual Status RunPreFilterExtensionAddPod(const std::shared_ptr<CycleState> &state,
                                               const resource_view::Pod &podToSchedule,
                                               const resource_view::Pod &podToAdd,
                                               const resource_view::NodeInfo &nodeInfo) = 0;
    virtual Status RunPreFilterExtensionRemovePod(const std::shared_ptr<CycleState> &state,
                                                  const resource_view::Pod &podToSchedule,
                                                  const resource_view::Pod &podToRemove,
                                                  const resource_view::NodeInfo &nodeInfo) = 0;

    virtual ScheduleResults SelectFeasible(const std::shared_ptr<CycleState> &state, const resource_view::Pod &pod,
                                           const std::vector<std::shared_ptr<resource_view::NodeInfo>> &nodes) = 0;

    virtual QueueingHint IsPodWorthRequeuing(const resource_view::Pod &pod, const ClusterEvent &event,
                                             const resource_view::ProtoMessage *oldObj,
                                             const resource_view::ProtoMessage *newObj) = 0;
};
}  // namespace volsched::schedule_framework
#endif  // SCHEDULER_FRAMEWORK_H
