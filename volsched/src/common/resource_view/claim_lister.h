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

#ifndef COMMON_RESOURCE_VIEW_CLAIM_LISTER_H
#define COMMON_RESOURCE_VIEW_CLAIM_LISTER_H

#include <string>

#include "resource_type.h"
#include "status/status.h"

namespace volsched::resource_view {

/**
 * Read access to the persistent volume claims known to the scheduler.
 */
class ClaimLister {
public:
    ClaimLister() = default;
    virtual ~ClaimLister() = default;

    /**
     * @brief Point lookup of a claim.
     * @param ns Namespace of the claim.
     * @param name Name of the claim.
     * @param claim Filled with the claim when found.
     * @return OK, CLAIM_NOT_FOUND when the claim does not exist, or the error of the underlying store.
     */
    virtual Status Get(const std::string &ns, const std::string &name, PersistentVolumeClaim &claim) const = 0;
};

}  // namespace volsched::resource_view

#endif  // COMMON_RESOURCE_VIEW_CLAIM_LISTER_H
