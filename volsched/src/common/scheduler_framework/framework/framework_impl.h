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
#ifndef SCHEDULER_FRAMEWORK_IMPL_H
#define SCHEDULER_FRAMEWORK_IMPL_H

#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "resource_type.h"
#include "common/scheduler_framework/framework/framework.h"
#include "common/scheduler_framework/framework/policy.h"
#include "status/status.h"

namespace volsched::schedule_framework {
class FrameworkImpl : public Framework {
public:
    FrameworkImpl() = default;
    ~FrameworkImpl() override = default;
    bool RegisterPolicy(const std::shared_ptr<SchedulePolicyPlugin> &plugin) override;
    bool UnRegisterPolicy(const std::string &name) override;

    Status RunPreFilterPlugins(const std::shared_ptr<CycleState> &state, const resource_view::Pod &pod) override;
    Filtered RunFilterPlugins(const std::shared_ptr<CycleState> &state, const resource_view::Pod &pod,
                              const resource_view::NodeInfo &nodeInfo) override;
    Status RunPreFilterExtensionAddPod(const std::shared_ptr<CycleState> &state,
                                       const resource_view::Pod &podToSchedule, const resource_view::Pod &podToAdd,
                                       const resource_view::NodeInfo &nodeInfo) override;
    Status RunPreFilterExtensionRemovePod(const std::shared_ptr<CycleState> &state,
                                          const resource_view::Pod &podToSchedule,
                                          const resource_view::Pod &podToRemove,
                                          const resource_view::NodeInfo &nodeInfo) override;

    ScheduleResults SelectFeasible(const std::shared_ptr<CycleState> &state, const resource_view::Pod &pod,
                                   const std::vector<std::shared_ptr<resource_view::NodeInfo>> &nodes) override;

    QueueingHint IsPodWorthRequeuing(const resource_view::Pod &pod, const ClusterEvent &event,
                                     const resource_view::ProtoMessage *oldObj,
                                     const resource_view::ProtoMessage *newObj) override;

private:
    std::vector<PolicyType> GetExtensionPoints(const std::shared_ptr<SchedulePolicyPlugin> &plugin) const;

    using Plugins = std::map<std::string, std::shared_ptr<SchedulePolicyPlugin>>;
    std::unordered_map<PolicyType, Plugins> plugins_;
    // registered events in plugin registration order, paired with the name of the plugin
    std::vector<std::pair<std::string, ClusterEventWithHint>> queueingHints_;
};
}  // namespace volsched::schedule_framework
#endif  // SCHEDULER_FRAMEWORK_IMPL_H
