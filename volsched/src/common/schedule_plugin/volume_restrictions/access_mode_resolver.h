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

#ifndef VOLSCHED_ACCESS_MODE_RESOLVER_H
#define VOLSCHED_ACCESS_MODE_RESOLVER_H

#include <memory>
#include <string>
#include <unordered_set>

#include "resource_type.h"
#include "common/resource_view/claim_lister.h"
#include "status/status.h"

namespace volsched::schedule_plugin::volume_restrictions {

// claim names, all in the namespace of the pod they were resolved for
using ClaimNameSet = std::unordered_set<std::string>;

bool HasAccessMode(const resource_view::PersistentVolumeClaim &claim, resource_view::AccessMode mode);

/**
 * Resolves the claims referenced by the volumes of a pod through the claim lister.
 */
class AccessModeResolver {
public:
    explicit AccessModeResolver(const std::shared_ptr<resource_view::ClaimLister> &claimLister)
        : claimLister_(claimLister)
    {
    }
    ~AccessModeResolver() = default;

    /**
     * @brief Collect the claims of the pod with the ReadWriteOncePod access mode.
     * @param pod The pod whose volumes are resolved.
     * @param ignoreNotFound Skip claims that do not exist instead of failing.
     * @param claims Filled with the names of the exclusive claims.
     * @return OK, or the lookup error of the first claim that could not be resolved.
     */
    Status ReadWriteOncePodPVCsForPod(const resource_view::Pod &pod, bool ignoreNotFound,
                                      ClaimNameSet &claims) const;

    /**
     * @brief Look up every claim referenced by the pod.
     * @param claims Filled with the names of the referenced claims.
     * @return OK only if every referenced claim exists.
     */
    Status ReferencedPVCsForPod(const resource_view::Pod &pod, ClaimNameSet &claims) const;

private:
    std::shared_ptr<resource_view::ClaimLister> claimLister_;
};

}  // namespace volsched::schedule_plugin::volume_restrictions

#endif  // VOLSCHED_ACCESS_MODE_RESOLVER_H
