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

#include "status/status.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>

namespace volsched::test {
class StatusTest : public ::testing::Test {};

Status ReturnFailed()
{
    return Status(StatusCode::FAILED);
}

Status ReturnIfNotOk()
{
    RETURN_IF_NOT_OK(ReturnFailed());
    return Status::OK();
}

Status ReturnIfNull(const std::shared_ptr<int> &ptr)
{
    RETURN_STATUS_IF_NULL(ptr, StatusCode::POINTER_IS_NULL, "ptr is null");
    return Status::OK();
}

TEST_F(StatusTest, StatusOK)
{
    auto status = Status::OK();
    EXPECT_TRUE(status.IsOk());
    EXPECT_TRUE(static_cast<bool>(status));
    EXPECT_EQ(status.GetMessage(), "[]");
    EXPECT_EQ(status.RawMessage(), "");
}

TEST_F(StatusTest, StatusFailed)
{
    auto status = Status(StatusCode::FAILED);
    EXPECT_FALSE(status.IsOk());
    EXPECT_TRUE(status.IsError());
    EXPECT_TRUE(status == StatusCode::FAILED);
    EXPECT_TRUE(status != StatusCode::SUCCESS);
}

TEST_F(StatusTest, MarcoTest)
{
    EXPECT_TRUE(ReturnIfNotOk().IsError());
    EXPECT_EQ(ReturnIfNull(nullptr).StatusCode(), StatusCode::POINTER_IS_NULL);
    EXPECT_TRUE(ReturnIfNull(std::make_shared<int>(1)).IsOk());
}

TEST_F(StatusTest, GetStatusDefaultDescription)
{
    auto status = Status::OK();
    EXPECT_EQ(status.ToString(), "[code: 0, status: No error occurs]");
}

TEST_F(StatusTest, GetStatusDetailDescription)
{
    auto status = Status(StatusCode::CLAIM_NOT_FOUND, "persistentvolumeclaim \"c1\" not found");
    EXPECT_EQ(status.ToString(), "[code: 400, status: Persistent volume claim not found], "
                                 "detail: [persistentvolumeclaim \"c1\" not found]");
    EXPECT_EQ(status.RawMessage(), "persistentvolumeclaim \"c1\" not found");
}

/**
 * Description: messages appended to a copy do not change the original
 */
TEST_F(StatusTest, GetStatusAppendDescription)
{
    auto status = Status(StatusCode::PLUGIN_REGISTER_ERROR, "first");
    auto copied = status;
    copied.AppendMessage("second");
    EXPECT_TRUE(copied.MultipleErr());
    EXPECT_EQ(copied.GetMessage(), "[first][second]");
    EXPECT_FALSE(status.MultipleErr());
    EXPECT_EQ(status.GetMessage(), "[first]");
    EXPECT_TRUE(status == copied);
}

TEST_F(StatusTest, GetStatusInfo)
{
    EXPECT_EQ(Status::GetStatusInfo(StatusCode::STATE_NOT_FOUND), "Cycle state not found");
    EXPECT_EQ(Status::GetStatusInfo(StatusCode::UNEXPECTED_EVENT_PAYLOAD), "Unexpected cluster event payload");
    EXPECT_EQ(Status::GetStatusInfo(static_cast<StatusCode>(999)), "");
}

}  // namespace volsched::test
