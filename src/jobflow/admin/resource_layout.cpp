#include "jobflow/admin/resource_layout.hpp"

#include "jobflow/util/log.hpp"

#include <algorithm>
#include <array>
#include <ranges>
#include <utility>

namespace jobflow {

namespace {

constexpr std::string_view kNumPartitions = "NUM_PARTITIONS";
constexpr std::string_view kReplicas = "REPLICAS";
constexpr std::string_view kStateModel = "STATE_MODEL_DEF_REF";
constexpr std::string_view kRebalanceMode = "REBALANCE_MODE";
constexpr std::string_view kRebalancerClass = "REBALANCER_CLASS_NAME";
constexpr std::string_view kDisableExternalView = "DISABLE_EXTERNAL_VIEW";

constexpr std::array<std::string_view, 4> kModeNames = {
    "TASK",
    "CUSTOMIZED",
    "FULL_AUTO",
    "SEMI_AUTO",
};

}  // namespace

auto rebalance_mode_name(RebalanceMode mode) noexcept -> std::string_view {
  auto idx = std::to_underlying(mode);
  return idx < kModeNames.size() ? kModeNames[idx] : "UNKNOWN";
}

auto parse_rebalance_mode(std::string_view name) noexcept
    -> std::optional<RebalanceMode> {
  auto it = std::ranges::find(kModeNames, name);
  if (it == kModeNames.end()) {
    return std::nullopt;
  }
  return static_cast<RebalanceMode>(
      std::ranges::distance(kModeNames.begin(), it));
}

auto ResourceLayout::to_record() const -> Record {
  Record r{resource};
  r.set_simple_int(kNumPartitions, num_partitions);
  r.set_simple_int(kReplicas, replicas);
  r.set_simple(kStateModel, state_model);
  r.set_simple(kRebalanceMode, std::string(rebalance_mode_name(mode)));
  if (!rebalancer_class.empty()) {
    r.set_simple(kRebalancerClass, rebalancer_class);
  }
  r.set_simple_bool(kDisableExternalView, disable_external_view);
  for (const auto& [partition, instances] : preference_lists) {
    r.set_list(partition, instances);
  }
  for (const auto& [partition, states] : partition_state_maps) {
    r.set_map(partition, Record::MapField(states.begin(), states.end()));
  }
  return r;
}

auto ResourceLayout::from_record(const Record& r) -> Result<ResourceLayout> {
  ResourceLayout layout;
  layout.resource = r.id;
  layout.num_partitions =
      static_cast<int>(r.simple_int(kNumPartitions).value_or(1));
  layout.replicas = static_cast<int>(r.simple_int(kReplicas).value_or(1));
  layout.state_model = r.simple(kStateModel).value_or(std::string(kTaskStateModel));
  if (auto mode = r.simple(kRebalanceMode)) {
    auto parsed = parse_rebalance_mode(*mode);
    if (!parsed) {
      log::error("Resource {} has unknown rebalance mode {}", r.id, *mode);
      return fail(Error::ParseError);
    }
    layout.mode = *parsed;
  }
  layout.rebalancer_class = r.simple(kRebalancerClass).value_or("");
  layout.disable_external_view =
      r.simple_bool(kDisableExternalView).value_or(false);
  for (const auto& [partition, instances] : r.list_fields) {
    layout.preference_lists.emplace(partition, instances);
  }
  for (const auto& [partition, states] : r.map_fields) {
    layout.partition_state_maps.emplace(
        partition, std::map<std::string, std::string, std::less<>>(
                       states.begin(), states.end()));
  }
  return ok(std::move(layout));
}

auto workflow_layout(std::string_view workflow) -> ResourceLayout {
  ResourceLayout layout;
  layout.resource = std::string(workflow);
  layout.num_partitions = 1;
  layout.replicas = 1;
  layout.state_model = std::string(kTaskStateModel);
  layout.mode = RebalanceMode::Task;
  layout.rebalancer_class = std::string(kWorkflowRebalancerClass);
  layout.disable_external_view = true;
  layout.preference_lists.emplace(std::string(workflow),
                                  std::vector<std::string>{});
  layout.partition_state_maps.emplace(
      std::string(workflow), std::map<std::string, std::string, std::less<>>{});
  return layout;
}

}  // namespace jobflow
