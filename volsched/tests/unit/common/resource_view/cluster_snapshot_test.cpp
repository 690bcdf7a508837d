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

#include "common/resource_view/cluster_snapshot.h"

#include <gtest/gtest.h>

#include "../schedule_plugin/common/plugin_utils.h"

namespace volsched::test {
using namespace resource_view;
using namespace schedule_plugin;

class ClusterSnapshotTest : public ::testing::Test {};

/**
 * Description: claim usage index follows pod placement
 * Steps:
 * 1. build a snapshot with two nodes, a pod using c1 on node1 and an unbound pod using c2
 * 2. c1 is in use, c2 is not, unbound pod is not placed
 * 3. a second pod using c1 is placed, then the first is removed --> c1 still in use
 * 4. the second pod is removed --> c1 no longer in use
 */
TEST_F(ClusterSnapshotTest, ClaimUsageIndex)
{
    auto holder = GetPod("default", "holder", { GetClaimVolume("c1") }, "node1");
    auto unbound = GetPod("default", "unbound", { GetClaimVolume("c2") });
    ClusterSnapshot snapshot({ GetNode("node1"), GetNode("node2") }, { holder, unbound });

    EXPECT_EQ(snapshot.NumNodes(), 2u);
    EXPECT_TRUE(snapshot.IsPVCUsedByPods(GetNamespacedName("default", "c1")));
    EXPECT_FALSE(snapshot.IsPVCUsedByPods(GetNamespacedName("default", "c2")));
    EXPECT_FALSE(snapshot.IsPVCUsedByPods(GetNamespacedName("other", "c1")));
    EXPECT_EQ(snapshot.Get("node1")->GetPods().size(), 1u);
    EXPECT_TRUE(snapshot.Get("node2")->GetPods().empty());

    auto sharer = GetPod("default", "sharer", { GetClaimVolume("c1") }, "node2");
    EXPECT_TRUE(snapshot.AddPod(sharer).IsOk());
    EXPECT_TRUE(snapshot.RemovePod(holder).IsOk());
    EXPECT_TRUE(snapshot.IsPVCUsedByPods(GetNamespacedName("default", "c1")));

    EXPECT_TRUE(snapshot.RemovePod(sharer).IsOk());
    EXPECT_FALSE(snapshot.IsPVCUsedByPods(GetNamespacedName("default", "c1")));
}

/**
 * Description: node infos handed out before a placement change keep their pods
 * Steps:
 * 1. get node1 holding one pod
 * 2. add a pod to node1, then remove the first pod
 * 3. the node info of step 1 still holds only the first pod, a new Get sees the change
 */
TEST_F(ClusterSnapshotTest, ListedNodeInfoIsStable)
{
    auto holder = GetPod("default", "holder", { GetClaimVolume("c1") }, "node1");
    ClusterSnapshot snapshot({ GetNode("node1") }, { holder });
    auto listed = snapshot.List();
    auto nodeInfo = snapshot.Get("node1");
    ASSERT_EQ(listed.size(), 1u);
    ASSERT_NE(nodeInfo, nullptr);

    EXPECT_TRUE(snapshot.AddPod(GetPod("default", "other", {}, "node1")).IsOk());
    EXPECT_TRUE(snapshot.RemovePod(holder).IsOk());

    ASSERT_EQ(nodeInfo->GetPods().size(), 1u);
    EXPECT_EQ(nodeInfo->GetPods()[0]->name(), "holder");
    ASSERT_EQ(listed[0]->GetPods().size(), 1u);
    EXPECT_EQ(listed[0]->GetPods()[0]->name(), "holder");

    auto current = snapshot.Get("node1");
    ASSERT_EQ(current->GetPods().size(), 1u);
    EXPECT_EQ(current->GetPods()[0]->name(), "other");
}

TEST_F(ClusterSnapshotTest, AddPodToUnknownNode)
{
    ClusterSnapshot snapshot;
    EXPECT_TRUE(snapshot.AddNode(GetNode("node1")).IsOk());
    EXPECT_EQ(snapshot.AddNode(GetNode("node1")).StatusCode(), StatusCode::PARAMETER_ERROR);

    auto pod = GetPod("default", "p", { GetClaimVolume("c1") }, "node9");
    EXPECT_EQ(snapshot.AddPod(pod).StatusCode(), StatusCode::NODE_NOT_FOUND);
    EXPECT_EQ(snapshot.AddPod(GetPod("default", "p", {})).StatusCode(), StatusCode::PARAMETER_ERROR);
    EXPECT_FALSE(snapshot.IsPVCUsedByPods(GetNamespacedName("default", "c1")));
    EXPECT_EQ(snapshot.RemovePod(GetPod("default", "p", {}, "node1")).StatusCode(), StatusCode::PARAMETER_ERROR);
    EXPECT_EQ(snapshot.Get("node9"), nullptr);
}

TEST_F(ClusterSnapshotTest, ListKeepsNodeOrder)
{
    ClusterSnapshot snapshot({ GetNode("b"), GetNode("a"), GetNode("c") }, {});
    auto nodeInfos = snapshot.List();
    ASSERT_EQ(nodeInfos.size(), 3u);
    EXPECT_EQ(nodeInfos[0]->GetName(), "b");
    EXPECT_EQ(nodeInfos[1]->GetName(), "a");
    EXPECT_EQ(nodeInfos[2]->GetName(), "c");
}

TEST_F(ClusterSnapshotTest, NodeInfoClone)
{
    auto nodeInfo = GetNodeInfo("node1", { GetPod("default", "p1", {}), GetPod("default", "p2", {}) });
    auto cloned = nodeInfo.Clone();
    EXPECT_TRUE(cloned->RemovePod(GetPod("default", "p1", {})));
    EXPECT_FALSE(cloned->RemovePod(GetPod("default", "p1", {})));
    EXPECT_EQ(cloned->GetPods().size(), 1u);
    EXPECT_EQ(nodeInfo.GetPods().size(), 2u);
    EXPECT_EQ(cloned->GetName(), "node1");
}

}  // namespace volsched::test
