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

#include "status.h"

#include <sstream>
#include <vector>

namespace volsched {

std::map<enum StatusCode, std::string> Status::statusInfoMap_ = {
    // Common
    { FAILED, "Common error code" },
    { SUCCESS, "No error occurs" },
    { RESERVED, "Reserved error code" },
    { LOG_CONFIG_ERROR, "Log config error" },
    { PARAMETER_ERROR, "Parameter error" },
    { POINTER_IS_NULL, "Pointer is null" },

    // Schedule framework
    { PLUGIN_REGISTER_ERROR, "Failed to register schedule plugin" },
    { PLUGIN_UNREGISTER_ERROR, "Failed to unregister schedule plugin" },
    { FILTER_PLUGIN_ERROR, "Filter plugin error" },
    { ERR_SCHEDULE_PLUGIN_CONFIG, "Invalid schedule plugin config" },
    { STATE_NOT_FOUND, "Cycle state not found" },
    { UNEXPECTED_EVENT_PAYLOAD, "Unexpected cluster event payload" },

    // Schedule result
    { UNSCHEDULABLE, "Pod is unschedulable on the node" },
    { UNSCHEDULABLE_AND_UNRESOLVABLE, "Pod is unschedulable until the cluster changes" },
    { SCHEDULE_SKIP, "Plugin skipped" },

    // Cluster view
    { CLAIM_NOT_FOUND, "Persistent volume claim not found" },
    { CLAIM_LOOKUP_ERROR, "Failed to look up persistent volume claim" },
    { NODE_NOT_FOUND, "Node not found in snapshot" },
};

std::string Status::GetStatusInfo(enum StatusCode code)
{
    const auto iter = statusInfoMap_.find(code);
    return iter == statusInfoMap_.end() ? "" : iter->second;
}

struct Status::Data {
    enum StatusCode statusCode = SUCCESS;
    std::string statusInfo = GetStatusInfo(statusCode);
    std::vector<std::string> detailInfo;
};

Status::Status() : data_(std::make_shared<Data>())
{
}

Status::Status(enum StatusCode statusCode, const std::string &errMsg) : data_(std::make_shared<Data>())
{
    data_->statusCode = statusCode;
    data_->statusInfo = GetStatusInfo(statusCode);
    if (!errMsg.empty()) {
        data_->detailInfo.push_back(errMsg);
    }
}

std::string Status::ToString() const
{
    std::ostringstream ss;
    ss << "[code: " << static_cast<int>(data_->statusCode) << ", status: " << data_->statusInfo;
    if (data_->detailInfo.empty()) {
        ss << "]";
        return ss.str();
    }
    ss << "], detail: ";
    for (auto &info : data_->detailInfo) {
        ss << "[" << info << "]";
    }
    return ss.str();
}

std::string Status::GetMessage() const
{
    if (data_->detailInfo.empty()) {
        return "[]";
    }
    std::ostringstream ss;
    for (auto &info : data_->detailInfo) {
        ss << "[" << info << "]";
    }
    return ss.str();
}

const std::string &Status::RawMessage() const
{
    if (data_->detailInfo.empty()) {
        static std::string nullStr;
        return nullStr;
    }
    return data_->detailInfo[0];
}

bool Status::MultipleErr() const
{
    return data_->detailInfo.size() > 1;
}

void Status::AppendMessage(const std::string &errMsg)
{
    // copy on write, statuses share the payload after copy
    if (data_.use_count() > 1) {
        data_ = std::make_shared<Data>(*data_);
    }
    data_->detailInfo.push_back(errMsg);
}

enum StatusCode Status::StatusCode() const
{
    return data_->statusCode;
}

std::ostream &operator<<(std::ostream &os, const Status &s)
{
    os << s.ToString();
    return os;
}

bool Status::operator==(const Status &other) const
{
    return data_->statusCode == other.data_->statusCode;
}

bool Status::operator==(enum StatusCode otherCode) const
{
    return StatusCode() == otherCode;
}

bool Status::operator!=(const Status &other) const
{
    return !operator==(other);
}

bool Status::operator!=(enum StatusCode otherCode) const
{
    return !operator==(otherCode);
}

Status::operator bool() const
{
    return IsOk();
}

Status Status::OK()
{
    return {};
}

bool Status::IsOk() const
{
    return StatusCode() == StatusCode::SUCCESS;
}

bool Status::IsError() const
{
    return !IsOk();
}

}  // namespace volsched
