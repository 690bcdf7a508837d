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

#ifndef VOLSCHED_STATUS_H
#define VOLSCHED_STATUS_H

#include <map>
#include <memory>
#include <string>

#ifdef RETURN_IF_NOT_OK
#undef RETURN_IF_NOT_OK
#endif
#define RETURN_IF_NOT_OK(statement)          \
    do {                                     \
        ::volsched::Status rc = (statement); \
        if (rc.IsError()) {                  \
            return rc;                       \
        }                                    \
    } while (false)

#ifdef RETURN_STATUS_IF_NULL
#undef RETURN_STATUS_IF_NULL
#endif
#define RETURN_STATUS_IF_NULL(x, c, m)       \
    do {                                     \
        if ((x) == nullptr) {                \
            return ::volsched::Status(c, m); \
        }                                    \
    } while (false)

namespace volsched {

enum CompCode : int32_t {
    COMMON = 0,
    SCHEDULE_FRAMEWORK = 200,
    SCHEDULE_RESULT = 300,
    CLUSTER_VIEW = 400,
    END = 1000,
};

enum StatusCode : int32_t {
    FAILED = static_cast<int>(COMMON) - 1,
    SUCCESS = static_cast<int>(COMMON),
    // Error code 1 is reserved, which should never use.
    RESERVED = static_cast<int>(COMMON) + 1,
    LOG_CONFIG_ERROR,
    PARAMETER_ERROR,
    POINTER_IS_NULL,

    // Schedule framework error code, range [200, 300)
    PLUGIN_REGISTER_ERROR = static_cast<int>(SCHEDULE_FRAMEWORK),
    PLUGIN_UNREGISTER_ERROR,
    FILTER_PLUGIN_ERROR,
    ERR_SCHEDULE_PLUGIN_CONFIG,
    STATE_NOT_FOUND,
    UNEXPECTED_EVENT_PAYLOAD,

    // Schedule result code, range [300, 400)
    // the unit is not feasible, other units or a later attempt may be
    UNSCHEDULABLE = static_cast<int>(SCHEDULE_RESULT),
    // no unit is feasible until the cluster changes in a way the plugin recognizes
    UNSCHEDULABLE_AND_UNRESOLVABLE,
    // the plugin has nothing to check for the pod in this attempt
    SCHEDULE_SKIP,

    // Cluster view error code, range [400, 500)
    CLAIM_NOT_FOUND = static_cast<int>(CLUSTER_VIEW),
    CLAIM_LOOKUP_ERROR,
    NODE_NOT_FOUND,
};

class Status {
public:
    Status();
    explicit Status(enum StatusCode statusCode, const std::string &errMsg = "");

    ~Status() = default;

    static Status OK();

    void AppendMessage(const std::string &errMsg);
    enum StatusCode StatusCode() const;
    std::string ToString() const;
    std::string GetMessage() const;
    const std::string &RawMessage() const;
    bool MultipleErr() const;

    bool operator==(const Status &other) const;
    bool operator==(enum StatusCode otherCode) const;
    bool operator!=(const Status &other) const;
    bool operator!=(enum StatusCode otherCode) const;

    bool IsOk() const;
    bool IsError() const;

    explicit operator bool() const;

    friend std::ostream &operator<<(std::ostream &os, const Status &s);

    static std::string GetStatusInfo(enum StatusCode code);

private:
    struct Data;
    std::shared_ptr<Data> data_;
    static std::map<enum StatusCode, std::string> statusInfoMap_;
};

}  // namespace volsched

#endif  // VOLSCHED_STATUS_H
