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

#ifndef COMMON_RESOURCE_VIEW_CLAIM_CACHE_H
#define COMMON_RESOURCE_VIEW_CLAIM_CACHE_H

#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "common/resource_view/claim_lister.h"

namespace volsched::resource_view {

class ClaimCache : public ClaimLister {
public:
    ClaimCache() = default;
    ~ClaimCache() override = default;

    Status Get(const std::string &ns, const std::string &name, PersistentVolumeClaim &claim) const override;

    /**
     * @brief Insert a claim, replacing a cached claim with the same namespace and name.
     * @return true if the claim was not cached before.
     */
    bool Add(const PersistentVolumeClaim &claim);

    /**
     * @brief Replace a cached claim.
     * @return CLAIM_NOT_FOUND if no claim with the same namespace and name is cached.
     */
    Status Update(const PersistentVolumeClaim &claim);

    bool Delete(const std::string &ns, const std::string &name);

    size_t Size() const;

private:
    mutable std::shared_mutex mutex_;
    // key: namespace/name
    std::unordered_map<std::string, PersistentVolumeClaim> claims_;
};

}  // namespace volsched::resource_view

#endif  // COMMON_RESOURCE_VIEW_CLAIM_CACHE_H
