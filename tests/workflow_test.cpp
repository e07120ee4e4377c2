#include "jobflow/model/workflow.hpp"
#include "jobflow/util/id.hpp"

#include "gtest/gtest.h"

#include "test_utils.hpp"

using namespace jobflow;

class WorkflowTest : public ::testing::Test {
protected:
  Workflow workflow_{"W"};
};

TEST_F(WorkflowTest, AddJob_NamespacesNameAndConfig) {
  workflow_.add_job("extract", test::make_job());

  ASSERT_TRUE(workflow_.job_configs().contains("W_extract"));
  const auto& job = workflow_.job_configs().at("W_extract");
  EXPECT_EQ(job.workflow, "W");
  EXPECT_EQ(job.job_id, "W_extract");
  EXPECT_TRUE(workflow_.config().dag.has_node("W_extract"));
  EXPECT_EQ(workflow_.config().workflow_id, "W");
}

TEST_F(WorkflowTest, Dependency_UsesNamespacedNames) {
  workflow_.add_job("extract", test::make_job());
  workflow_.add_job("load", test::make_job());
  workflow_.add_parent_child_dependency("extract", "load");

  EXPECT_TRUE(workflow_.config().dag.direct_children("W_extract").contains(
      "W_load"));
  EXPECT_TRUE(workflow_.validate().has_value());
}

TEST_F(WorkflowTest, Validate_DagNodeWithoutConfig_Fails) {
  workflow_.add_job("extract", test::make_job());
  workflow_.mutable_config().dag.add_node("W_ghost");

  auto r = workflow_.validate();

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::InvalidArgument);
}

TEST_F(WorkflowTest, Validate_BadJobConfig_Fails) {
  workflow_.add_job("extract", JobConfig{});

  EXPECT_FALSE(workflow_.validate().has_value());
}

TEST_F(WorkflowTest, Validate_Cycle_Fails) {
  workflow_.add_job("a", test::make_job());
  workflow_.add_job("b", test::make_job());
  workflow_.add_parent_child_dependency("a", "b");
  workflow_.add_parent_child_dependency("b", "a");

  auto r = workflow_.validate();

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::CycleDetected);
}

TEST_F(WorkflowTest, Validate_JobNameWithSlash_Fails) {
  workflow_.add_job("extract/part", test::make_job());

  auto r = workflow_.validate();

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::InvalidArgument);
}

TEST(WorkflowNameTest, Validate_EmptyOrSlashName_Fails) {
  for (const auto* name : {"", "nightly/etl"}) {
    Workflow wf(name);
    wf.add_job("a", test::make_job());

    auto r = wf.validate();

    ASSERT_FALSE(r.has_value()) << name;
    EXPECT_EQ(r.error(), Error::InvalidArgument) << name;
  }
}

TEST_F(WorkflowTest, Validate_Empty_Ok) {
  EXPECT_TRUE(workflow_.validate().has_value());
}

TEST(JobQueueTest, MakeJobQueue_IsNotTerminable) {
  auto queue = make_job_queue("Q", 3);

  EXPECT_EQ(queue.name(), "Q");
  EXPECT_FALSE(queue.config().terminable);
  EXPECT_EQ(queue.config().capacity, 3);
  EXPECT_TRUE(queue.config().dag.empty());
}

TEST(NameTest, Namespacing) {
  EXPECT_EQ(namespaced_job_name("Q", "J1"), "Q_J1");
  EXPECT_EQ(denamespaced_job_name("Q", "Q_J1"), "J1");
  EXPECT_EQ(denamespaced_job_name("Q", "R_J1"), "R_J1");
  EXPECT_TRUE(is_namespaced_by("W", "W_1"));
  EXPECT_FALSE(is_namespaced_by("W", "W_"));
  EXPECT_FALSE(is_namespaced_by("W", "WX_1"));
  EXPECT_FALSE(is_namespaced_by("W", "W"));
  EXPECT_EQ(scheduled_workflow_name("W", "20240101"), "W_20240101");
}

TEST(NameTest, ValidNames) {
  EXPECT_TRUE(is_valid_name("Q_J1"));
  EXPECT_FALSE(is_valid_name(""));
  EXPECT_FALSE(is_valid_name("J/x"));
  EXPECT_FALSE(is_valid_name("/"));
}
