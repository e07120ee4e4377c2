#pragma once

#include "jobflow/store/metadata_store.hpp"

#include <string>
#include <string_view>

namespace jobflow {

// Hint to the rebalance subsystem that a workflow needs another look.
// Fire-and-forget: implementations log failures instead of returning them.
class RebalanceTrigger {
public:
  virtual ~RebalanceTrigger() = default;

  virtual auto invoke_rebalance(std::string_view workflow) -> void = 0;
};

// Rewrites the workflow's resource layout unchanged, so store watchers see
// a new version of it.
class StoreRebalanceTrigger final : public RebalanceTrigger {
public:
  StoreRebalanceTrigger(MetadataStore& store, std::string cluster)
      : store_(store), cluster_(std::move(cluster)) {
  }

  auto invoke_rebalance(std::string_view workflow) -> void override;

private:
  MetadataStore& store_;
  std::string cluster_;
};

}  // namespace jobflow
