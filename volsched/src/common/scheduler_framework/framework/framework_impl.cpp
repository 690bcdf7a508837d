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

#include "framework_impl.h"

#include <set>
#include <sstream>
#include <string>
#include <type_traits>

#include "logs/logging.h"
#include "common/scheduler_framework/framework/policy.h"
#include "status/status.h"

using namespace volsched::resource_view;

namespace volsched::schedule_framework {

struct AggregatedStatus {
    std::map<std::string, uint32_t> results;
    void Insert(const Status &status)
    {
        auto iter = results.find(status.RawMessage());
        if (iter == results.end()) {
            results.emplace(status.RawMessage(), 1);
            return;
        }
        iter->second++;
    }

    std::string Dump(const std::string &desc)
    {
        std::ostringstream oss;
        oss << desc << (results.empty() ? ", " : ", The reasons are as follows:\n");
        for (auto iter = results.begin(); iter != results.end(); iter++) {
            oss << "\t" << iter->second << " node with [" << iter->first << "]." << std::endl;
        }
        return oss.str();
    }
};

bool FrameworkImpl::RegisterPolicy(const std::shared_ptr<SchedulePolicyPlugin> &plugin)
{
    if (plugin == nullptr) {
        VSLOG_ERROR("failed to register a null plugin");
        return false;
    }
    auto name = plugin->GetPluginName();
    for (const auto &pair : plugins_) {
        if (pair.second.find(name) != pair.second.end()) {
            VSLOG_ERROR("duplicate plugin {}", name);
            return false;
        }
    }
    auto extensionPoints = GetExtensionPoints(plugin);
    if (extensionPoints.empty()) {
        VSLOG_ERROR("plugin {} implements no extension point", name);
        return false;
    }
    for (auto type : extensionPoints) {
        (void)plugins_[type].emplace(name, plugin);
        VSLOG_DEBUG("register plugin {} type({})", name, static_cast<std::underlying_type_t<PolicyType>>(type));
    }
    if (auto enqueue = std::dynamic_pointer_cast<EnqueueExtensions>(plugin); enqueue != nullptr) {
        for (auto &registration : enqueue->EventsToRegister()) {
            queueingHints_.emplace_back(name, std::move(registration));
        }
    }
    return true;
}

bool FrameworkImpl::UnRegisterPolicy(const std::string &name)
{
    bool found = false;
    for (auto &pair : plugins_) {
        if (pair.second.erase(name) > 0) {
            found = true;
        }
    }
    for (auto iter = queueingHints_.begin(); iter != queueingHints_.end();) {
        iter = iter->first == name ? queueingHints_.erase(iter) : iter + 1;
    }
    if (!found) {
        VSLOG_WARN("Plugin {} not exist", name);
    }
    return found;
}

Status FrameworkImpl::RunPreFilterPlugins(const std::shared_ptr<CycleState> &state, const Pod &pod)
{
    std::set<std::string> skipPlugins;
    auto policy = plugins_.find(PolicyType::PRE_FILTER_POLICY);
    if (policy == plugins_.end()) {
        state->SetSkipFilterPlugins(skipPlugins);
        return Status::OK();
    }
    for (auto it = policy->second.begin(); it != policy->second.end(); ++it) {
        auto pre = std::dynamic_pointer_cast<PreFilterPlugin>(it->second);
        auto status = pre->PreFilter(state, pod);
        if (status == StatusCode::SCHEDULE_SKIP) {
            VSLOG_DEBUG("{}|plugin({}) has nothing to check, skip its filter", PodKey(pod), it->first);
            (void)skipPlugins.insert(it->first);
            continue;
        }
        if (status.IsError()) {
            VSLOG_ERROR("{}|failed to run prefilter plugin({}), {}", PodKey(pod), it->first, status.ToString());
            return status;
        }
    }
    state->SetSkipFilterPlugins(skipPlugins);
    return Status::OK();
}

Filtered FrameworkImpl::RunFilterPlugins(const std::shared_ptr<CycleState> &state, const Pod &pod,
                                         const NodeInfo &nodeInfo)
{
    auto policy = plugins_.find(PolicyType::FILTER_POLICY);
    if (policy == plugins_.end() || policy->second.empty()) {
        VSLOG_WARN("no plugin of key PolicyType::FILTER_POLICY in map");
        return Filtered{ Status(StatusCode::ERR_SCHEDULE_PLUGIN_CONFIG,
                                "empty filter plugin, please check schedule plugins configure."),
                         true };
    }
    for (auto it = policy->second.begin(); it != policy->second.end(); ++it) {
        if (state->IsFilterPluginSkipped(it->first)) {
            continue;
        }
        auto filter = std::dynamic_pointer_cast<FilterPlugin>(it->second);
        auto filtered = filter->Filter(state, pod, nodeInfo);
        if (filtered.status.IsOk()) {
            continue;
        }
        if (filtered.isFatalErr) {
            VSLOG_ERROR("{}|failed to schedule pod on node({}), plugin({}) raise err: {}", PodKey(pod),
                        nodeInfo.GetName(), it->first, filtered.status.ToString());
            return filtered;
        }
        // the node was not feasible, reason was returned by status
        VSLOG_DEBUG("{}|node({}) is filtered by plugin({}), {}", PodKey(pod), nodeInfo.GetName(), it->first,
                    filtered.status.RawMessage());
        return filtered;
    }
    // the node was filtered successfully by all filter plugin
    return Filtered{ Status::OK(), false };
}

Status FrameworkImpl::RunPreFilterExtensionAddPod(const std::shared_ptr<CycleState> &state,
                                                  const Pod &podToSchedule, const Pod &podToAdd,
                                                  const NodeInfo &nodeInfo)
{
    auto policy = plugins_.find(PolicyType::PRE_FILTER_POLICY);
    if (policy == plugins_.end()) {
        return Status::OK();
    }
    for (auto it = policy->second.begin(); it != policy->second.end(); ++it) {
        auto extensions = std::dynamic_pointer_cast<PreFilterPlugin>(it->second)->GetPreFilterExtensions();
        if (extensions == nullptr || state->IsFilterPluginSkipped(it->first)) {
            continue;
        }
        if (auto status = extensions->AddPod(state, podToSchedule, podToAdd, nodeInfo); status.IsError()) {
            VSLOG_ERROR("{}|failed to add pod({}) on plugin({}), {}", PodKey(podToSchedule), PodKey(podToAdd),
                        it->first, status.ToString());
            return status;
        }
    }
    return Status::OK();
}

Status FrameworkImpl::RunPreFilterExtensionRemovePod(const std::shared_ptr<CycleState> &state,
                                                     const Pod &podToSchedule, const Pod &podToRemove,
                                                     const NodeInfo &nodeInfo)
{
    auto policy = plugins_.find(PolicyType::PRE_FILTER_POLICY);
    if (policy == plugins_.end()) {
        return Status::OK();
    }
    for (auto it = policy->second.begin(); it != policy->second.end(); ++it) {
        auto extensions = std::dynamic_pointer_cast<PreFilterPlugin>(it->second)->GetPreFilterExtensions();
        if (extensions == nullptr || state->IsFilterPluginSkipped(it->first)) {
            continue;
        }
        if (auto status = extensions->RemovePod(state, podToSchedule, podToRemove, nodeInfo); status.IsError()) {
            VSLOG_ERROR("{}|failed to remove pod({}) on plugin({}), {}", PodKey(podToSchedule),
                        PodKey(podToRemove), it->first, status.ToString());
            return status;
        }
    }
    return Status::OK();
}

ScheduleResults FrameworkImpl::SelectFeasible(const std::shared_ptr<CycleState> &state, const Pod &pod,
                                              const std::vector<std::shared_ptr<NodeInfo>> &nodes)
{
    VSLOG_INFO("{}|going to schedule pod with {} volumes on {} nodes", PodKey(pod), pod.volumes_size(),
               nodes.size());
    auto status = RunPreFilterPlugins(state, pod);
    if (status.IsError()) {
        return ScheduleResults{ static_cast<int32_t>(status.StatusCode()),
                                status.MultipleErr() ? status.GetMessage() : status.RawMessage(),
                                {} };
    }
    std::vector<std::string> feasibleNodes;
    AggregatedStatus aggregate;
    for (const auto &nodeInfo : nodes) {
        if (nodeInfo == nullptr) {
            continue;
        }
        auto filtered = RunFilterPlugins(state, pod, *nodeInfo);
        if (filtered.status.IsError()) {
            if (filtered.isFatalErr) {
                return ScheduleResults{ static_cast<int32_t>(filtered.status.StatusCode()),
                                        filtered.status.RawMessage(),
                                        {} };
            }
            aggregate.Insert(filtered.status);
            continue;
        }
        feasibleNodes.push_back(nodeInfo->GetName());
    }
    if (feasibleNodes.empty()) {
        auto reason = aggregate.Dump("no available node that meets the volume requirements");
        VSLOG_ERROR("{}|failed to schedule pod, {}", PodKey(pod), reason);
        return ScheduleResults{ static_cast<int32_t>(StatusCode::UNSCHEDULABLE), reason, {} };
    }
    return ScheduleResults{ static_cast<int32_t>(StatusCode::SUCCESS), "", std::move(feasibleNodes) };
}

QueueingHint FrameworkImpl::IsPodWorthRequeuing(const Pod &pod, const ClusterEvent &event, const ProtoMessage *oldObj,
                                                const ProtoMessage *newObj)
{
    for (const auto &[pluginName, registration] : queueingHints_) {
        if (!registration.event.Match(event)) {
            continue;
        }
        if (!registration.queueingHintFn) {
            VSLOG_DEBUG("{}|plugin({}) requeues pod on every matching event", PodKey(pod), pluginName);
            return QueueingHint::QUEUE;
        }
        auto result = registration.queueingHintFn(pod, oldObj, newObj);
        if (result.status.IsError()) {
            // a missed wake up is worse than a spurious one
            VSLOG_ERROR("{}|queueing hint of plugin({}) failed, requeue pod: {}", PodKey(pod), pluginName,
                        result.status.ToString());
            return QueueingHint::QUEUE;
        }
        VSLOG_DEBUG("{}|queueing hint of plugin({}) is {}", PodKey(pod), pluginName, QueueingHintName(result.hint));
        if (result.hint == QueueingHint::QUEUE) {
            return QueueingHint::QUEUE;
        }
    }
    return QueueingHint::QUEUE_SKIP;
}

std::vector<PolicyType> FrameworkImpl::GetExtensionPoints(const std::shared_ptr<SchedulePolicyPlugin> &plugin) const
{
    std::vector<PolicyType> types;
    if (std::dynamic_pointer_cast<PreFilterPlugin>(plugin) != nullptr) {
        types.push_back(PolicyType::PRE_FILTER_POLICY);
    }
    if (std::dynamic_pointer_cast<FilterPlugin>(plugin) != nullptr) {
        types.push_back(PolicyType::FILTER_POLICY);
    }
    if (std::dynamic_pointer_cast<EnqueueExtensions>(plugin) != nullptr) {
        types.push_back(PolicyType::ENQUEUE_POLICY);
    }
    return types;
}
}  // namespace volsched::schedule_framework
