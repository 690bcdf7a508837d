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
#ifndef SCHEDULER_POLICY_PLUGIN_H
#define SCHEDULER_POLICY_PLUGIN_H

#include <memory>
#include <string>
#include <vector>

#include "resource_type.h"
#include "common/resource_view/node_info.h"
#include "common/scheduler_framework/framework/cluster_event.h"
#include "common/scheduler_framework/framework/cycle_state.h"
#include "status/status.h"

namespace volsched::schedule_framework {

enum class PolicyType { PRE_FILTER_POLICY, FILTER_POLICY, ENQUEUE_POLICY };

/**
 * Base of every scheduler plugin. Extension points derive from it virtually, so that one plugin object
 * may implement several of them.
 */
class SchedulePolicyPlugin {
public:
    SchedulePolicyPlugin() = default;
    virtual ~SchedulePolicyPlugin() = default;
    virtual std::string GetPluginName() = 0;
};

/**
 * Incremental updates of the state written at PreFilter, used while the scheduler simulates pods being
 * added to or removed from a node.
 */
class PreFilterExtensions {
public:
    PreFilterExtensions() = default;
    virtual ~PreFilterExtensions() = default;

    virtual Status AddPod(const std::shared_ptr<CycleState> &state, const resource_view::Pod &podToSchedule,
                          const resource_view::Pod &podToAdd, const resource_view::NodeInfo &nodeInfo) = 0;

    virtual Status RemovePod(const std::shared_ptr<CycleState> &state, const resource_view::Pod &podToSchedule,
                             const resource_view::Pod &podToRemove, const resource_view::NodeInfo &nodeInfo) = 0;
};

class PreFilterPlugin : public virtual SchedulePolicyPlugin {
public:
    PreFilterPlugin() = default;
    ~PreFilterPlugin() override = default;

    /**
     * Compute the per-attempt state of a pod before any node is filtered.
     * @param state: Keyed store of the current scheduling attempt.
     * @param pod: The pod to schedule.
     * @return Status: SCHEDULE_SKIP if the plugin has nothing to check for the pod, so its Filter is never
     * called in this attempt. UNSCHEDULABLE_AND_UNRESOLVABLE if no node can be feasible.
     */
    virtual Status PreFilter(const std::shared_ptr<CycleState> &state, const resource_view::Pod &pod) = 0;

    // nullptr if the plugin keeps no state that needs updating during simulation
    virtual PreFilterExtensions *GetPreFilterExtensions()
    {
        return nullptr;
    }
};

struct Filtered {
    Status status;
    // If a fatal error is returned, the scheduling cannot be continued.
    // while status is ok, isFatalErr would be ignored
    bool isFatalErr;
};

class FilterPlugin : public virtual SchedulePolicyPlugin {
public:
    FilterPlugin() = default;
    ~FilterPlugin() override = default;

    /**
     * Determine whether a single node meets requirements.
     * @param state: Keyed store of the current scheduling attempt, filled by PreFilter.
     * @param pod: The pod to schedule.
     * @param nodeInfo: The node and the pods already placed on it.
     * @return Filtered: The cause of a rejection must be specified in the status.
     */
    virtual Filtered Filter(const std::shared_ptr<CycleState> &state, const resource_view::Pod &pod,
                            const resource_view::NodeInfo &nodeInfo) = 0;
};

class EnqueueExtensions : public virtual SchedulePolicyPlugin {
public:
    EnqueueExtensions() = default;
    ~EnqueueExtensions() override = default;

    // events that may make a pod rejected by this plugin schedulable
    virtual std::vector<ClusterEventWithHint> EventsToRegister() = 0;
};

}  // namespace volsched::schedule_framework
#endif
