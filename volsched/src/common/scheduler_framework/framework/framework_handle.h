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

#ifndef SCHEDULER_FRAMEWORK_HANDLE_H
#define SCHEDULER_FRAMEWORK_HANDLE_H

#include <memory>

#include "common/resource_view/claim_lister.h"
#include "common/resource_view/shared_lister.h"

namespace volsched::schedule_framework {

/**
 * Cluster view handed to plugins when they are created.
 */
class FrameworkHandle {
public:
    FrameworkHandle(const std::shared_ptr<resource_view::ClaimLister> &claimLister,
                    const std::shared_ptr<resource_view::SharedLister> &snapshot)
        : claimLister_(claimLister), snapshot_(snapshot)
    {
    }
    ~FrameworkHandle() = default;

    std::shared_ptr<resource_view::ClaimLister> GetClaimLister() const
    {
        return claimLister_;
    }

    std::shared_ptr<resource_view::SharedLister> SnapshotSharedLister() const
    {
        return snapshot_;
    }

private:
    std::shared_ptr<resource_view::ClaimLister> claimLister_;
    std::shared_ptr<resource_view::SharedLister> snapshot_;
};

}  // namespace volsched::schedule_framework

#endif  // SCHEDULER_FRAMEWORK_HANDLE_H
