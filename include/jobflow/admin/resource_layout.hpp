#pragma once

#include "jobflow/core/error.hpp"
#include "jobflow/store/record.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jobflow {

inline constexpr std::string_view kTaskStateModel = "Task";
inline constexpr std::string_view kWorkflowRebalancerClass =
    "WorkflowRebalancer";

enum class RebalanceMode : std::uint8_t {
  Task,
  Custom,
  FullAuto,
  SemiAuto,
};

[[nodiscard]] auto rebalance_mode_name(RebalanceMode mode) noexcept
    -> std::string_view;
[[nodiscard]] auto parse_rebalance_mode(std::string_view name) noexcept
    -> std::optional<RebalanceMode>;

// How a schedulable resource is laid out across the cluster. Kept at
// IDEALSTATES/<resource>; the rebalancer owns the contents after creation.
struct ResourceLayout {
  using PreferenceLists =
      std::map<std::string, std::vector<std::string>, std::less<>>;
  using StateMaps = std::map<std::string,
                             std::map<std::string, std::string, std::less<>>,
                             std::less<>>;

  std::string resource;
  int num_partitions{1};
  int replicas{1};
  std::string state_model{kTaskStateModel};
  RebalanceMode mode{RebalanceMode::Task};
  std::string rebalancer_class;
  bool disable_external_view{false};
  PreferenceLists preference_lists;
  StateMaps partition_state_maps;

  [[nodiscard]] auto to_record() const -> Record;
  [[nodiscard]] static auto from_record(const Record& record)
      -> Result<ResourceLayout>;

  [[nodiscard]] friend auto operator==(const ResourceLayout&,
                                       const ResourceLayout&)
      -> bool = default;
};

// Single-partition task resource driven by the workflow rebalancer.
[[nodiscard]] auto workflow_layout(std::string_view workflow) -> ResourceLayout;

}  // namespace jobflow
