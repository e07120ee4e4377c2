#pragma once

#include "jobflow/store/path.hpp"

#include <format>
#include <string>
#include <string_view>

namespace jobflow {

// Store layout of one cluster:
//   /<cluster>/CONFIGS/RESOURCE/<name>                          workflow/job config
//   /<cluster>/IDEALSTATES/<name>                               resource layout
//   /<cluster>/PROPERTYSTORE/TaskRebalancer/<name>/Context      workflow/job context
//   /<cluster>/PROPERTYSTORE/TaskRebalancer/<name>/UserContent  user content
class KeyBuilder {
public:
  explicit KeyBuilder(std::string cluster) : cluster_(std::move(cluster)) {
  }

  [[nodiscard]] auto cluster() const noexcept -> const std::string& {
    return cluster_;
  }

  [[nodiscard]] auto resource_configs() const -> std::string {
    return std::format("/{}/CONFIGS/RESOURCE", cluster_);
  }
  [[nodiscard]] auto resource_config(std::string_view name) const
      -> std::string {
    return path::join(resource_configs(), name);
  }

  [[nodiscard]] auto ideal_states() const -> std::string {
    return std::format("/{}/IDEALSTATES", cluster_);
  }
  [[nodiscard]] auto ideal_state(std::string_view name) const -> std::string {
    return path::join(ideal_states(), name);
  }

  [[nodiscard]] auto rebalancer_context_root() const -> std::string {
    return std::format("/{}/PROPERTYSTORE/TaskRebalancer", cluster_);
  }
  // Everything the rebalancer keeps for one workflow or job.
  [[nodiscard]] auto rebalancer_context(std::string_view name) const
      -> std::string {
    return path::join(rebalancer_context_root(), name);
  }
  [[nodiscard]] auto context(std::string_view name) const -> std::string {
    return path::join(rebalancer_context(name), "Context");
  }
  [[nodiscard]] auto user_content(std::string_view name) const
      -> std::string {
    return path::join(rebalancer_context(name), "UserContent");
  }

private:
  std::string cluster_;
};

}  // namespace jobflow
