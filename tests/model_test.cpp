#include "jobflow/model/job_config.hpp"
#include "jobflow/model/job_context.hpp"
#include "jobflow/model/task_state.hpp"
#include "jobflow/model/workflow_config.hpp"
#include "jobflow/model/workflow_context.hpp"

#include <format>

#include "gtest/gtest.h"

using namespace jobflow;

TEST(TaskStateTest, NamesRoundTrip) {
  for (auto state : {TaskState::NotStarted, TaskState::InProgress,
                     TaskState::Stopped, TaskState::Completed,
                     TaskState::Failed, TaskState::Aborted}) {
    EXPECT_EQ(parse_task_state(task_state_name(state)), state);
  }
  EXPECT_EQ(task_state_name(TaskState::InProgress), "IN_PROGRESS");
  EXPECT_FALSE(parse_task_state("in_progress").has_value());
  EXPECT_EQ(std::format("{}", TargetState::Delete), "DELETE");
}

TEST(TaskStateTest, TerminalStates) {
  EXPECT_TRUE(is_terminal(TaskState::Completed));
  EXPECT_TRUE(is_terminal(TaskState::Failed));
  EXPECT_TRUE(is_terminal(TaskState::Aborted));
  EXPECT_FALSE(is_terminal(TaskState::NotStarted));
  EXPECT_FALSE(is_terminal(TaskState::InProgress));
  EXPECT_FALSE(is_terminal(TaskState::Stopped));
}

class JobConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    job_.workflow = "Q";
    job_.job_id = "Q_J1";
    job_.command = "Reindex";
    job_.target_resource = "db";
    job_.target_partition_states = {"MASTER"};
  }

  JobConfig job_;
};

TEST_F(JobConfigTest, Validate_TargetedJob_Ok) {
  EXPECT_TRUE(job_.validate().has_value());
}

TEST_F(JobConfigTest, Validate_NoWorkflow_Fails) {
  job_.workflow.clear();

  auto r = job_.validate();

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::InvalidArgument);
}

TEST_F(JobConfigTest, Validate_NeitherTargetNorTasks_Fails) {
  job_.target_resource.clear();

  EXPECT_FALSE(job_.validate().has_value());
}

TEST_F(JobConfigTest, Validate_TasksWithoutTarget_Ok) {
  job_.target_resource.clear();
  job_.command.clear();
  job_.task_configs.push_back(TaskConfig{"t1", "Run", "", {}});

  EXPECT_TRUE(job_.validate().has_value());
}

TEST_F(JobConfigTest, Validate_BadLimits_Fail) {
  job_.max_attempts_per_task = 0;
  EXPECT_FALSE(job_.validate().has_value());

  job_.max_attempts_per_task = 1;
  job_.max_concurrent_tasks_per_instance = 0;
  EXPECT_FALSE(job_.validate().has_value());
}

TEST_F(JobConfigTest, Record_KeepsEveryField) {
  job_.job_type = "indexing";
  job_.target_partitions = {"db_0", "db_3"};
  job_.command_config = {{"mode", "full"}};
  job_.timeout_per_task = std::chrono::seconds(30);
  job_.max_attempts_per_task = 3;
  job_.failure_threshold = 2;
  job_.ignore_dependent_job_failure = true;
  job_.task_configs.push_back(TaskConfig{"t1", "Run", "db_1", {{"k", "v"}}});

  auto record = job_.to_record();
  auto parsed = JobConfig::from_record(record);

  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, job_);
  EXPECT_EQ(record.id, "Q_J1");
  EXPECT_EQ(record.simple("TimeoutPerPartition"), "30000");
  ASSERT_NE(record.map("t1"), nullptr);
  EXPECT_EQ(record.map("t1")->at("TASK_TARGET_PARTITION"), "db_1");
}

TEST_F(JobConfigTest, FromRecord_MissingLimits_UseDefaults) {
  Record r{"Q_J1"};
  r.set_simple("WorkflowID", "Q");
  r.set_simple("Command", "Reindex");

  auto parsed = JobConfig::from_record(r);

  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->job_id, "Q_J1");
  EXPECT_EQ(parsed->timeout_per_task, JobConfig::kDefaultTimeoutPerTask);
  EXPECT_EQ(parsed->max_attempts_per_task,
            JobConfig::kDefaultMaxAttemptsPerTask);
  EXPECT_FALSE(parsed->ignore_dependent_job_failure);
}

TEST_F(JobConfigTest, FromRecord_NoWorkflowId_IsParseError) {
  auto parsed = JobConfig::from_record(Record{"Q"});

  ASSERT_FALSE(parsed.has_value());
  EXPECT_EQ(parsed.error(), Error::ParseError);
}

TEST_F(JobConfigTest, FindTask) {
  job_.task_configs.push_back(TaskConfig{"t1", "Run", "", {}});

  ASSERT_NE(job_.find_task("t1"), nullptr);
  EXPECT_EQ(job_.find_task("t1")->command, "Run");
  EXPECT_EQ(job_.find_task("t2"), nullptr);
}

TEST(ScheduleConfigTest, Period) {
  EXPECT_FALSE(ScheduleConfig::one_time(5).period().has_value());
  EXPECT_EQ(
      ScheduleConfig::recurring(0, RecurrenceUnit::Minutes, 2).period(),
      std::chrono::milliseconds(120000));
  EXPECT_EQ(ScheduleConfig::recurring(0, RecurrenceUnit::Days, 1).period(),
            std::chrono::milliseconds(86400000));
  EXPECT_FALSE(
      ScheduleConfig::recurring(0, RecurrenceUnit::Hours, 0).is_recurring());
}

TEST(RecurrenceUnitTest, Names) {
  EXPECT_EQ(recurrence_unit_name(RecurrenceUnit::Seconds), "SECONDS");
  EXPECT_EQ(parse_recurrence_unit("DAYS"), RecurrenceUnit::Days);
  EXPECT_FALSE(parse_recurrence_unit("WEEKS").has_value());
}

class WorkflowConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    config_.workflow_id = "W";
    config_.dag.add_parent_to_child("W_a", "W_b");
  }

  WorkflowConfig config_;
};

TEST_F(WorkflowConfigTest, Record_KeepsEveryField) {
  config_.job_types = {{"W_a", "etl"}};
  config_.target_state = TargetState::Stop;
  config_.schedule = ScheduleConfig::recurring(1000, RecurrenceUnit::Hours, 6);
  config_.capacity = 10;
  config_.terminable = false;
  config_.parallel_jobs = 4;
  config_.expiry = std::chrono::minutes(5);
  config_.failure_threshold = 1;

  auto record = config_.to_record();
  auto parsed = WorkflowConfig::from_record(record);

  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, config_);
  EXPECT_TRUE(is_workflow_record(record));
  EXPECT_EQ(record.simple("TargetState"), "STOP");
  EXPECT_EQ(record.simple("RecurrenceUnit"), "HOURS");
}

TEST_F(WorkflowConfigTest, FromRecord_OneTimeSchedule) {
  config_.schedule = ScheduleConfig::one_time(42);

  auto parsed = WorkflowConfig::from_record(config_.to_record());

  ASSERT_TRUE(parsed.has_value());
  ASSERT_TRUE(parsed->schedule.has_value());
  EXPECT_EQ(parsed->schedule->start_time_ms, 42);
  EXPECT_FALSE(parsed->is_recurring());
}

TEST_F(WorkflowConfigTest, FromRecord_UnknownTargetState_IsParseError) {
  auto record = config_.to_record();
  record.set_simple("TargetState", "PAUSE");

  auto parsed = WorkflowConfig::from_record(record);

  ASSERT_FALSE(parsed.has_value());
  EXPECT_EQ(parsed.error(), Error::ParseError);
}

TEST_F(WorkflowConfigTest, FromRecord_JobConfig_IsParseError) {
  Record job{"W_a"};
  job.set_simple("WorkflowID", "W");

  EXPECT_FALSE(is_workflow_record(job));
  EXPECT_FALSE(WorkflowConfig::from_record(job).has_value());
}

TEST_F(WorkflowConfigTest, Validate_OverCapacity_Fails) {
  config_.capacity = 1;

  auto r = config_.validate();

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::InvalidArgument);
}

TEST_F(WorkflowConfigTest, Validate_Cycle_Fails) {
  config_.dag.add_parent_to_child("W_b", "W_a");

  auto r = config_.validate();

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::CycleDetected);
}

TEST_F(WorkflowConfigTest, RecordAccessors_EditInPlace) {
  config_.job_types = {{"W_a", "etl"}, {"W_b", "etl"}};
  auto record = config_.to_record();
  record.set_simple("Custom", "kept");

  auto dag = record_dag(record);
  ASSERT_TRUE(dag.has_value());
  dag->remove_node("W_a");
  set_record_dag(record, *dag);
  erase_record_job_types(record, {"W_a"});
  set_record_target_state(record, TargetState::Delete);

  auto parsed = WorkflowConfig::from_record(record);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->dag.all_nodes(), JobDag::NodeSet{"W_b"});
  EXPECT_EQ(parsed->job_types.size(), 1);
  EXPECT_EQ(record_target_state(record), TargetState::Delete);
  EXPECT_EQ(record.simple("Custom"), "kept");
}

TEST(RecordDagTest, MissingDag_ReadsEmpty) {
  auto dag = record_dag(Record{"x"});

  ASSERT_TRUE(dag.has_value());
  EXPECT_TRUE(dag->empty());
}

TEST(WorkflowContextTest, Record_KeepsEveryField) {
  WorkflowContext ctx;
  ctx.workflow = "W";
  ctx.workflow_state = TaskState::InProgress;
  ctx.job_states = {{"W_a", TaskState::Completed},
                    {"W_b", TaskState::InProgress}};
  ctx.start_time = 100;
  ctx.last_scheduled_workflow = "W_2";
  ctx.scheduled_workflows = {"W_1", "W_2"};

  auto parsed = WorkflowContext::from_record(ctx.to_record());

  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, ctx);
  EXPECT_FALSE(parsed->is_finished());
  EXPECT_EQ(parsed->job_state("W_a"), TaskState::Completed);
  EXPECT_FALSE(parsed->job_state("W_c").has_value());
}

TEST(WorkflowContextTest, FromRecord_UnknownStatesAreDropped) {
  Record r{"W"};
  r.set_simple("STATE", "SLEEPING");
  r.mutable_map("JOB_STATES")["W_a"] = "COMPLETED";
  r.mutable_map("JOB_STATES")["W_b"] = "SLEEPING";

  auto parsed = WorkflowContext::from_record(r);

  ASSERT_TRUE(parsed.has_value());
  EXPECT_FALSE(parsed->workflow_state.has_value());
  EXPECT_EQ(parsed->job_states.size(), 1);
  EXPECT_EQ(parsed->finish_time, kUnfinished);
}

TEST(WorkflowContextTest, StripJobStates) {
  WorkflowContext ctx;
  ctx.workflow = "Q";
  ctx.job_states = {{"Q_a", TaskState::Completed},
                    {"Q_b", TaskState::Failed}};
  auto record = ctx.to_record();

  EXPECT_TRUE(strip_record_job_states(record, {"Q_a", "Q_missing"}));
  EXPECT_FALSE(strip_record_job_states(record, {"Q_a"}));

  auto parsed = WorkflowContext::from_record(record);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->job_states.size(), 1);
  EXPECT_TRUE(parsed->job_states.contains("Q_b"));
}

TEST(WorkflowContextTest, RecordFinishTime) {
  WorkflowContext ctx;
  ctx.workflow = "W";
  ctx.finish_time = 1234;

  EXPECT_EQ(record_finish_time(ctx.to_record()), 1234);
  EXPECT_EQ(record_finish_time(Record{"W"}), kUnfinished);
}

TEST(JobContextTest, Record_KeepsPartitions) {
  JobContext ctx;
  ctx.job = "Q_J1";
  ctx.start_time = 10;
  ctx.partitions[0] = PartitionContext{TaskState::Completed, "node-1", 1, ""};
  ctx.partitions[1] = PartitionContext{TaskState::InProgress, "node-2", 2, "t1"};
  ctx.partitions[2] = PartitionContext{std::nullopt, "", 0, ""};

  auto parsed = JobContext::from_record(ctx.to_record());

  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, ctx);
  EXPECT_EQ(parsed->count_in_state(TaskState::InProgress), 1);
  ASSERT_NE(parsed->partition(1), nullptr);
  EXPECT_EQ(parsed->partition(1)->assigned_participant, "node-2");
  EXPECT_EQ(parsed->partition(7), nullptr);
}

TEST(JobContextTest, FromRecord_SkipsNonNumericPartitions) {
  Record r{"Q_J1"};
  r.mutable_map("0")["STATE"] = "FAILED";
  r.mutable_map("oops")["STATE"] = "FAILED";

  auto parsed = JobContext::from_record(r);

  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->partitions.size(), 1);
  EXPECT_EQ(parsed->count_in_state(TaskState::Failed), 1);
}
