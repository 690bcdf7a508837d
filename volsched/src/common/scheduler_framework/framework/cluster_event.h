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

#ifndef SCHEDULER_FRAMEWORK_CLUSTER_EVENT_H
#define SCHEDULER_FRAMEWORK_CLUSTER_EVENT_H

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "resource_type.h"
#include "status/status.h"

namespace volsched::schedule_framework {

enum class EventResource { POD, NODE, PERSISTENT_VOLUME_CLAIM };

enum ActionType : uint32_t {
    ADD = 1U,
    DELETE = 1U << 1U,
    UPDATE = 1U << 2U,
    ALL = ADD | DELETE | UPDATE,
};

struct ClusterEvent {
    EventResource resource;
    // bitmask of ActionType
    uint32_t actionType;

    // whether an incoming event is covered by this registration
    bool Match(const ClusterEvent &incoming) const
    {
        return resource == incoming.resource && (actionType & incoming.actionType) != 0;
    }
};

enum class QueueingHint { QUEUE_SKIP, QUEUE };

struct QueueingHintResult {
    QueueingHint hint;
    Status status;
};

/**
 * Decides whether an event may make a rejected pod schedulable. oldObj is null for creations, newObj is
 * null for deletions.
 */
using QueueingHintFn =
    std::function<QueueingHintResult(const resource_view::Pod &pod, const resource_view::ProtoMessage *oldObj,
                                     const resource_view::ProtoMessage *newObj)>;

struct ClusterEventWithHint {
    ClusterEvent event;
    // empty means every matching event requeues the pod
    QueueingHintFn queueingHintFn;
};

/**
 * @brief Cast the objects of an event to the type the hint expects. A null object stays null.
 * @return UNEXPECTED_EVENT_PAYLOAD if a non-null object is not a T.
 */
template <typename T>
Status As(const resource_view::ProtoMessage *oldObj, const resource_view::ProtoMessage *newObj, const T *&oldTyped,
          const T *&newTyped)
{
    oldTyped = nullptr;
    newTyped = nullptr;
    if (newObj != nullptr) {
        newTyped = dynamic_cast<const T *>(newObj);
        if (newTyped == nullptr) {
            return Status(StatusCode::UNEXPECTED_EVENT_PAYLOAD,
                          "expected " + T::descriptor()->full_name() + ", but got " + newObj->GetTypeName());
        }
    }
    if (oldObj != nullptr) {
        oldTyped = dynamic_cast<const T *>(oldObj);
        if (oldTyped == nullptr) {
            return Status(StatusCode::UNEXPECTED_EVENT_PAYLOAD,
                          "expected " + T::descriptor()->full_name() + ", but got " + oldObj->GetTypeName());
        }
    }
    return Status::OK();
}

inline std::string QueueingHintName(QueueingHint hint)
{
    return hint == QueueingHint::QUEUE ? "Queue" : "QueueSkip";
}

}  // namespace volsched::schedule_framework

#endif  // SCHEDULER_FRAMEWORK_CLUSTER_EVENT_H
