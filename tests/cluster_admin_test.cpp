#include "jobflow/admin/cluster_admin.hpp"
#include "jobflow/rebalance/rebalance_trigger.hpp"
#include "jobflow/store/key_builder.hpp"
#include "jobflow/store/memory_store.hpp"

#include "gtest/gtest.h"

using namespace jobflow;

class StoreClusterAdminTest : public ::testing::Test {
protected:
  InMemoryStore store_;
  StoreClusterAdmin admin_{store_};
  KeyBuilder keys_{"c"};
};

TEST_F(StoreClusterAdminTest, AddResource_WritesLayout) {
  ASSERT_TRUE(admin_.add_resource("c", "W", 1, kTaskStateModel).has_value());

  auto layout = admin_.get_resource_layout("c", "W");

  ASSERT_TRUE(layout.has_value());
  EXPECT_EQ(layout->resource, "W");
  EXPECT_EQ(layout->num_partitions, 1);
  EXPECT_EQ(layout->state_model, "Task");
  EXPECT_TRUE(*store_.exists(keys_.ideal_state("W")));
}

TEST_F(StoreClusterAdminTest, AddResource_Twice_IsAlreadyExists) {
  ASSERT_TRUE(admin_.add_resource("c", "W", 1, kTaskStateModel).has_value());

  auto r = admin_.add_resource("c", "W", 4, kTaskStateModel);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::AlreadyExists);
  EXPECT_EQ(admin_.get_resource_layout("c", "W")->num_partitions, 1);
}

TEST_F(StoreClusterAdminTest, AddResource_BadArguments_AreRejected) {
  EXPECT_EQ(admin_.add_resource("c", "", 1, kTaskStateModel).error(),
            Error::InvalidArgument);
  EXPECT_EQ(admin_.add_resource("c", "W", 0, kTaskStateModel).error(),
            Error::InvalidArgument);
}

TEST_F(StoreClusterAdminTest, GetResourceLayout_Missing_IsNotFound) {
  auto r = admin_.get_resource_layout("c", "nope");

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::NotFound);
}

TEST_F(StoreClusterAdminTest, SetResourceLayout_WorkflowLayout) {
  ASSERT_TRUE(admin_.add_resource("c", "W", 1, kTaskStateModel).has_value());

  ASSERT_TRUE(
      admin_.set_resource_layout("c", "W", workflow_layout("W")).has_value());
  auto layout = admin_.get_resource_layout("c", "W");

  ASSERT_TRUE(layout.has_value());
  EXPECT_EQ(*layout, workflow_layout("W"));
  EXPECT_EQ(layout->mode, RebalanceMode::Task);
  EXPECT_EQ(layout->rebalancer_class, kWorkflowRebalancerClass);
  EXPECT_TRUE(layout->disable_external_view);
  EXPECT_TRUE(layout->preference_lists.contains("W"));
}

TEST_F(StoreClusterAdminTest, DropResource_RemovesLayoutAndConfig) {
  ASSERT_TRUE(admin_.add_resource("c", "W", 1, kTaskStateModel).has_value());
  ASSERT_TRUE(store_.set(keys_.resource_config("W"), Record{"W"}).has_value());
  ASSERT_TRUE(store_.set(keys_.ideal_state("W_1"), Record{"W_1"}).has_value());

  ASSERT_TRUE(admin_.drop_resource("c", "W").has_value());

  EXPECT_FALSE(*store_.exists(keys_.ideal_state("W")));
  EXPECT_FALSE(*store_.exists(keys_.resource_config("W")));
  EXPECT_TRUE(*store_.exists(keys_.ideal_state("W_1")));
}

TEST_F(StoreClusterAdminTest, DropResource_Missing_Succeeds) {
  EXPECT_TRUE(admin_.drop_resource("c", "nope").has_value());
}

TEST(ResourceLayoutTest, ModeNames) {
  EXPECT_EQ(rebalance_mode_name(RebalanceMode::Custom), "CUSTOMIZED");
  EXPECT_EQ(parse_rebalance_mode("FULL_AUTO"), RebalanceMode::FullAuto);
  EXPECT_FALSE(parse_rebalance_mode("AUTO").has_value());
}

TEST(ResourceLayoutTest, FromRecord_UnknownMode_IsParseError) {
  auto record = workflow_layout("W").to_record();
  record.set_simple("REBALANCE_MODE", "MAGIC");

  auto r = ResourceLayout::from_record(record);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::ParseError);
}

class StoreRebalanceTriggerTest : public StoreClusterAdminTest {
protected:
  StoreRebalanceTrigger trigger_{store_, "c"};
};

TEST_F(StoreRebalanceTriggerTest, Invoke_BumpsLayoutVersion) {
  ASSERT_TRUE(admin_.add_resource("c", "W", 1, kTaskStateModel).has_value());
  auto before = store_.get(keys_.ideal_state("W"));
  ASSERT_TRUE(before.has_value() && before->has_value());

  trigger_.invoke_rebalance("W");

  auto after = store_.get(keys_.ideal_state("W"));
  ASSERT_TRUE(after.has_value() && after->has_value());
  EXPECT_EQ((*after)->version, (*before)->version + 1);
  EXPECT_EQ((*after)->record, (*before)->record);
}

TEST_F(StoreRebalanceTriggerTest, Invoke_NoLayout_WritesNothing) {
  trigger_.invoke_rebalance("W");

  EXPECT_FALSE(*store_.exists(keys_.ideal_state("W")));
}
