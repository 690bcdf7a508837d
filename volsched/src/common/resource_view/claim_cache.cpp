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

#include "claim_cache.h"

#include <mutex>

#include "logs/logging.h"

namespace volsched::resource_view {

Status ClaimCache::Get(const std::string &ns, const std::string &name, PersistentVolumeClaim &claim) const
{
    auto key = GetNamespacedName(ns, name);
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto iter = claims_.find(key);
    if (iter == claims_.end()) {
        return Status(StatusCode::CLAIM_NOT_FOUND, "persistentvolumeclaim \"" + name + "\" not found");
    }
    claim.CopyFrom(iter->second);
    return Status::OK();
}

bool ClaimCache::Add(const PersistentVolumeClaim &claim)
{
    auto key = GetNamespacedName(claim.namespace_(), claim.name());
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto ret = claims_.insert_or_assign(key, claim);
    VSLOG_DEBUG("{} claim {}", ret.second ? "add" : "replace", key);
    return ret.second;
}

Status ClaimCache::Update(const PersistentVolumeClaim &claim)
{
    auto key = GetNamespacedName(claim.namespace_(), claim.name());
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto iter = claims_.find(key);
    if (iter == claims_.end()) {
        VSLOG_WARN("failed to update claim {}, which is not cached", key);
        return Status(StatusCode::CLAIM_NOT_FOUND, "persistentvolumeclaim \"" + claim.name() + "\" not found");
    }
    iter->second.CopyFrom(claim);
    return Status::OK();
}

bool ClaimCache::Delete(const std::string &ns, const std::string &name)
{
    auto key = GetNamespacedName(ns, name);
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (claims_.erase(key) == 0) {
        VSLOG_WARN("claim {} not exist", key);
        return false;
    }
    return true;
}

size_t ClaimCache::Size() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return claims_.size();
}

}  // namespace volsched::resource_view
