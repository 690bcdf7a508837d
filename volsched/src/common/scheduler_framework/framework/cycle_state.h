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

#ifndef SCHEDULER_FRAMEWORK_CYCLE_STATE_H
#define SCHEDULER_FRAMEWORK_CYCLE_STATE_H

#include <memory>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "status/status.h"

namespace volsched::schedule_framework {

/**
 * Data a plugin computes once per scheduling attempt and stores in the CycleState.
 */
class StateData {
public:
    StateData() = default;
    virtual ~StateData() = default;
    // copy used by a simulation branch, must not share mutable members with the original
    virtual std::shared_ptr<StateData> Clone() const = 0;
};

/**
 * Per-attempt keyed store shared by the extension points of one scheduling attempt. Entries are written
 * during PreFilter and read concurrently while nodes are filtered.
 */
class CycleState {
public:
    CycleState() = default;
    ~CycleState() = default;

    void Write(const std::string &key, const std::shared_ptr<StateData> &data);

    /**
     * @brief Read the entry stored under key.
     * @return STATE_NOT_FOUND if nothing was written under key.
     */
    Status Read(const std::string &key, std::shared_ptr<StateData> &data) const;

    void Delete(const std::string &key);

    // every entry is cloned through StateData::Clone
    std::shared_ptr<CycleState> Clone() const;

    void SetSkipFilterPlugins(const std::set<std::string> &plugins);
    bool IsFilterPluginSkipped(const std::string &name) const;
    std::set<std::string> GetSkipFilterPlugins() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<StateData>> storage_;
    // plugins whose PreFilter reported there is nothing to check in this attempt
    std::set<std::string> skipFilterPlugins_;
};

/**
 * @brief Read the entry stored under key as T.
 * @return STATE_NOT_FOUND if nothing was written under key, FAILED if the entry is not a T.
 */
template <typename T>
Status ReadState(const CycleState &state, const std::string &key, std::shared_ptr<T> &data)
{
    std::shared_ptr<StateData> stored;
    RETURN_IF_NOT_OK(state.Read(key, stored));
    data = std::dynamic_pointer_cast<T>(stored);
    if (data == nullptr) {
        return Status(StatusCode::FAILED, "failed to convert state of " + key);
    }
    return Status::OK();
}

}  // namespace volsched::schedule_framework

#endif  // SCHEDULER_FRAMEWORK_CYCLE_STATE_H
