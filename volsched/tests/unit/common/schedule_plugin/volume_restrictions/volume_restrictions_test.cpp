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

#include "common/schedule_plugin/volume_restrictions/volume_restrictions.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../common/plugin_utils.h"
#include "common/resource_view/claim_cache.h"
#include "common/resource_view/cluster_snapshot.h"
#include "common/schedule_plugin/common/constants.h"
#include "common/schedule_plugin/common/plugin_config.h"
#include "common/scheduler_framework/framework/framework_impl.h"
#include "mocks/mock_claim_lister.h"

namespace volsched::test::schedule_plugin::volume_restrictions {
using namespace ::testing;
using namespace volsched::schedule_plugin;
using namespace volsched::schedule_plugin::volume_restrictions;
using namespace volsched::schedule_framework;
using resource_view::AccessMode;

class VolumeRestrictionsTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        claims_ = std::make_shared<resource_view::ClaimCache>();
        (void)claims_->Add(GetClaim("default", "c1", { AccessMode::READ_WRITE_ONCE_POD }));
        (void)claims_->Add(GetClaim("default", "rwo", { AccessMode::READ_WRITE_ONCE }));
        holder_ = GetPod("default", "holder", { GetClaimVolume("c1") }, "node1");
        snapshot_ = std::make_shared<resource_view::ClusterSnapshot>(
            std::vector<resource_view::Node>{ GetNode("node1"), GetNode("node2") },
            std::vector<resource_view::Pod>{ holder_ });
        plugin_ = std::make_shared<VolumeRestrictions>(claims_, snapshot_);
        state_ = std::make_shared<CycleState>();
    }

    int32_t GetConflictingCount()
    {
        std::shared_ptr<PreFilterState> preFilterState;
        auto status = ReadState(*state_, VOLUME_RESTRICTIONS_PRE_FILTER_STATE_KEY, preFilterState);
        EXPECT_TRUE(status.IsOk()) << status.ToString();
        return preFilterState == nullptr ? -1 : preFilterState->GetConflictingPVCRefCount();
    }

    std::shared_ptr<resource_view::ClaimCache> claims_;
    std::shared_ptr<resource_view::ClusterSnapshot> snapshot_;
    std::shared_ptr<VolumeRestrictions> plugin_;
    std::shared_ptr<CycleState> state_;
    resource_view::Pod holder_;
};

/**
 * Description: a pod without restricted volumes and without claims in use needs no check
 */
TEST_F(VolumeRestrictionsTest, PreFilterSkip)
{
    auto pod = GetPod("default", "p", { GetHostPathVolume("/data"), GetClaimVolume("rwo") });
    auto status = plugin_->PreFilter(state_, pod);
    EXPECT_EQ(status.StatusCode(), StatusCode::SCHEDULE_SKIP);
    std::shared_ptr<StateData> data;
    EXPECT_EQ(state_->Read(VOLUME_RESTRICTIONS_PRE_FILTER_STATE_KEY, data).StatusCode(), StatusCode::STATE_NOT_FOUND);
}

TEST_F(VolumeRestrictionsTest, PreFilterRestrictedVolume)
{
    auto pod = GetPod("default", "p", { GetPersistentDiskVolume("d1", false) });
    EXPECT_TRUE(plugin_->PreFilter(state_, pod).IsOk());
    EXPECT_EQ(GetConflictingCount(), 0);
}

/**
 * Description: claim c1 is ReadWriteOncePod and used by a running pod, a pod referencing c1 is rejected
 * by every node
 */
TEST_F(VolumeRestrictionsTest, ReadWriteOncePodClaimInUse)
{
    auto pod = GetPod("default", "p", { GetClaimVolume("c1") });
    ASSERT_TRUE(plugin_->PreFilter(state_, pod).IsOk());
    EXPECT_EQ(GetConflictingCount(), 1);

    for (const auto &nodeInfo : snapshot_->List()) {
        auto filtered = plugin_->Filter(state_, pod, *nodeInfo);
        // preemption of the holder may free the claim
        EXPECT_EQ(filtered.status.StatusCode(), StatusCode::UNSCHEDULABLE);
        EXPECT_EQ(filtered.status.RawMessage(), ERR_REASON_READ_WRITE_ONCE_POD_CONFLICT);
        EXPECT_FALSE(filtered.isFatalErr);
    }
}

TEST_F(VolumeRestrictionsTest, ReadWriteOncePodClaimOfOtherNamespaceNotInUse)
{
    (void)claims_->Add(GetClaim("other", "c1", { AccessMode::READ_WRITE_ONCE_POD }));
    auto pod = GetPod("other", "p", { GetClaimVolume("c1") });
    // counts nothing, and the pod has no restricted volume
    EXPECT_EQ(plugin_->PreFilter(state_, pod).StatusCode(), StatusCode::SCHEDULE_SKIP);
}

TEST_F(VolumeRestrictionsTest, PreFilterMissingClaim)
{
    auto pod = GetPod("default", "p", { GetClaimVolume("missing") });
    auto status = plugin_->PreFilter(state_, pod);
    EXPECT_EQ(status.StatusCode(), StatusCode::UNSCHEDULABLE_AND_UNRESOLVABLE);
    EXPECT_EQ(status.RawMessage(), "persistentvolumeclaim \"missing\" not found");
}

TEST_F(VolumeRestrictionsTest, PreFilterLookupError)
{
    auto lister = std::make_shared<MockClaimLister>();
    EXPECT_CALL(*lister, Get(_, _, _)).WillOnce(Return(Status(StatusCode::CLAIM_LOOKUP_ERROR, "store unavailable")));
    VolumeRestrictions plugin(lister, snapshot_);
    auto status = plugin.PreFilter(state_, GetPod("default", "p", { GetClaimVolume("c1") }));
    EXPECT_EQ(status.StatusCode(), StatusCode::CLAIM_LOOKUP_ERROR);
    EXPECT_EQ(status.RawMessage(), "store unavailable");
}

/**
 * Description: pod A uses rbd image p/img through monitors m1 and m2, node N hosts pod B using the same
 * image through m2, both writable, so A is rejected by N
 */
TEST_F(VolumeRestrictionsTest, FilterDiskConflict)
{
    auto podA = GetPod("default", "a", { GetRbdVolume({ "m1", "m2" }, "p", "img", false) });
    auto podB = GetPod("default", "b", { GetRbdVolume({ "m2" }, "p", "img", false) }, "N");
    ASSERT_TRUE(plugin_->PreFilter(state_, podA).IsOk());

    auto filtered = plugin_->Filter(state_, podA, GetNodeInfo("N", { podB }));
    EXPECT_EQ(filtered.status.StatusCode(), StatusCode::UNSCHEDULABLE);
    EXPECT_EQ(filtered.status.RawMessage(), ERR_REASON_DISK_CONFLICT);
    EXPECT_FALSE(filtered.isFatalErr);

    EXPECT_TRUE(plugin_->Filter(state_, podA, GetNodeInfo("M", {})).status.IsOk());
}

TEST_F(VolumeRestrictionsTest, FilterWithoutStateIsFatal)
{
    auto pod = GetPod("default", "p", { GetPersistentDiskVolume("d1", false) });
    auto filtered = plugin_->Filter(state_, pod, GetNodeInfo("N", {}));
    EXPECT_EQ(filtered.status.StatusCode(), StatusCode::STATE_NOT_FOUND);
    EXPECT_TRUE(filtered.isFatalErr);
}

/**
 * Description: Test preemption simulation
 * 1. remove the pod holding c1  --> the pod fits
 * 2. add it back                --> rejected again
 * 3. a cloned state is updated without touching the original
 */
TEST_F(VolumeRestrictionsTest, AddRemovePod)
{
    auto pod = GetPod("default", "p", { GetClaimVolume("c1") });
    auto nodeInfo = snapshot_->Get("node1");
    ASSERT_NE(nodeInfo, nullptr);
    ASSERT_TRUE(plugin_->PreFilter(state_, pod).IsOk());
    ASSERT_NE(plugin_->GetPreFilterExtensions(), nullptr);

    auto branch = state_->Clone();
    ASSERT_TRUE(plugin_->RemovePod(branch, pod, holder_, *nodeInfo).IsOk());
    EXPECT_TRUE(plugin_->Filter(branch, pod, *nodeInfo).status.IsOk());
    EXPECT_EQ(plugin_->Filter(state_, pod, *nodeInfo).status.StatusCode(), StatusCode::UNSCHEDULABLE);

    ASSERT_TRUE(plugin_->AddPod(branch, pod, holder_, *nodeInfo).IsOk());
    EXPECT_EQ(plugin_->Filter(branch, pod, *nodeInfo).status.StatusCode(), StatusCode::UNSCHEDULABLE);

    auto empty = std::make_shared<CycleState>();
    EXPECT_EQ(plugin_->AddPod(empty, pod, holder_, *nodeInfo).StatusCode(), StatusCode::STATE_NOT_FOUND);
    EXPECT_EQ(plugin_->RemovePod(empty, pod, holder_, *nodeInfo).StatusCode(), StatusCode::STATE_NOT_FOUND);
}

/**
 * Description: a victim of another namespace using a claim of the same name is removed and added back,
 * the pod still fits
 */
TEST_F(VolumeRestrictionsTest, ReprieveVictimOfOtherNamespace)
{
    (void)claims_->Add(GetClaim("default", "free", { AccessMode::READ_WRITE_ONCE_POD }));
    auto pod = GetPod("default", "p", { GetClaimVolume("free"), GetPersistentDiskVolume("d1", false) });
    auto victim = GetPod("other", "victim", { GetClaimVolume("free") }, "node2");
    auto nodeInfo = GetNodeInfo("node2", { victim });
    ASSERT_TRUE(plugin_->PreFilter(state_, pod).IsOk());
    EXPECT_EQ(GetConflictingCount(), 0);

    ASSERT_TRUE(plugin_->RemovePod(state_, pod, victim, nodeInfo).IsOk());
    ASSERT_TRUE(plugin_->AddPod(state_, pod, victim, nodeInfo).IsOk());
    EXPECT_EQ(GetConflictingCount(), 0);
    EXPECT_TRUE(plugin_->Filter(state_, pod, nodeInfo).status.IsOk());
}

TEST_F(VolumeRestrictionsTest, EventsToRegister)
{
    auto events = plugin_->EventsToRegister();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].event.resource, EventResource::POD);
    EXPECT_EQ(events[0].event.actionType, static_cast<uint32_t>(ActionType::DELETE));
    EXPECT_TRUE(static_cast<bool>(events[0].queueingHintFn));
    EXPECT_EQ(events[1].event.resource, EventResource::NODE);
    EXPECT_EQ(events[1].event.actionType, static_cast<uint32_t>(ActionType::ADD));
    EXPECT_FALSE(static_cast<bool>(events[1].queueingHintFn));
    EXPECT_EQ(events[2].event.resource, EventResource::PERSISTENT_VOLUME_CLAIM);
    EXPECT_EQ(events[2].event.actionType, static_cast<uint32_t>(ActionType::ADD | ActionType::UPDATE));
    EXPECT_TRUE(static_cast<bool>(events[2].queueingHintFn));
}

/**
 * Description: the plugin registered by configuration drives a scheduling attempt
 * Steps:
 * 1. register VolumeRestrictions from ["VolumeRestrictions"]
 * 2. a pod sharing a writable disk with a pod on node1 --> only node2 is feasible
 * 3. a pod referencing c1                                --> no node is feasible
 * 4. a pod without restricted volumes                    --> every node is feasible
 */
TEST_F(VolumeRestrictionsTest, ScheduleWithFramework)
{
    ASSERT_TRUE(snapshot_->AddPod(GetPod("default", "disk", { GetPersistentDiskVolume("d1", false) }, "node1")).IsOk());
    auto framework = std::make_shared<FrameworkImpl>();
    auto handle = std::make_shared<FrameworkHandle>(claims_, snapshot_);
    ASSERT_TRUE(RegisterPolicies(framework, handle, R"(["VolumeRestrictions"])").IsOk());

    {
        auto pod = GetPod("default", "p1", { GetPersistentDiskVolume("d1", false) });
        auto results = framework->SelectFeasible(std::make_shared<CycleState>(), pod, snapshot_->List());
        EXPECT_EQ(results.code, static_cast<int32_t>(StatusCode::SUCCESS));
        EXPECT_THAT(results.feasibleNodes, ElementsAre("node2"));
    }
    {
        auto pod = GetPod("default", "p2", { GetClaimVolume("c1") });
        auto results = framework->SelectFeasible(std::make_shared<CycleState>(), pod, snapshot_->List());
        EXPECT_EQ(results.code, static_cast<int32_t>(StatusCode::UNSCHEDULABLE));
        EXPECT_THAT(results.reason, HasSubstr("2 node with [" + ERR_REASON_READ_WRITE_ONCE_POD_CONFLICT + "]"));
    }
    {
        auto pod = GetPod("default", "p3", { GetHostPathVolume("/data") });
        auto state = std::make_shared<CycleState>();
        auto results = framework->SelectFeasible(state, pod, snapshot_->List());
        EXPECT_EQ(results.code, static_cast<int32_t>(StatusCode::SUCCESS));
        EXPECT_THAT(results.feasibleNodes, ElementsAre("node1", "node2"));
        EXPECT_TRUE(state->IsFilterPluginSkipped(VOLUME_RESTRICTIONS_NAME));
    }
}

/**
 * Description: preemption simulation through the framework
 * Steps:
 * 1. a pod referencing c1 in use  --> UNSCHEDULABLE, not unresolvable, so preemption may be tried
 * 2. remove the holder of c1      --> the pod fits
 */
TEST_F(VolumeRestrictionsTest, PreemptionWithFramework)
{
    auto framework = std::make_shared<FrameworkImpl>();
    ASSERT_TRUE(framework->RegisterPolicy(plugin_));
    auto pod = GetPod("default", "p", { GetClaimVolume("c1") });
    auto nodeInfo = snapshot_->Get("node1");
    ASSERT_TRUE(framework->RunPreFilterPlugins(state_, pod).IsOk());
    auto filtered = framework->RunFilterPlugins(state_, pod, *nodeInfo);
    EXPECT_EQ(filtered.status.StatusCode(), StatusCode::UNSCHEDULABLE);
    EXPECT_FALSE(filtered.isFatalErr);

    auto simulated = nodeInfo->Clone();
    ASSERT_TRUE(simulated->RemovePod(holder_));
    ASSERT_TRUE(framework->RunPreFilterExtensionRemovePod(state_, pod, holder_, *simulated).IsOk());
    EXPECT_TRUE(framework->RunFilterPlugins(state_, pod, *simulated).status.IsOk());
}

}  // namespace volsched::test::schedule_plugin::volume_restrictions
