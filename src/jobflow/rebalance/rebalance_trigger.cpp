#include "jobflow/rebalance/rebalance_trigger.hpp"

#include "jobflow/store/atomic_update.hpp"
#include "jobflow/store/key_builder.hpp"
#include "jobflow/util/log.hpp"

namespace jobflow {

auto StoreRebalanceTrigger::invoke_rebalance(std::string_view workflow)
    -> void {
  KeyBuilder keys{cluster_};
  bool touched = false;
  auto r = update_with_retry(
      store_, keys.ideal_state(workflow),
      [&touched](std::optional<Record> current)
          -> Result<std::optional<Record>> {
        touched = current.has_value();
        return ok(std::move(current));
      });
  if (!r) {
    log::warn("Failed to trigger rebalance of {}: {}", workflow,
              r.error().message());
    return;
  }
  if (!touched) {
    log::debug("No layout for {}; rebalance not triggered", workflow);
  }
}

}  // namespace jobflow
