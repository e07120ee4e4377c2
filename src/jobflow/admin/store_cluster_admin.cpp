#include "jobflow/admin/cluster_admin.hpp"

#include "jobflow/store/key_builder.hpp"
#include "jobflow/util/log.hpp"

namespace jobflow {

auto StoreClusterAdmin::add_resource(std::string_view cluster,
                                     std::string_view name, int partitions,
                                     std::string_view state_model)
    -> Result<void> {
  if (name.empty() || partitions < 1) {
    log::warn("Rejecting resource '{}' with {} partitions", name, partitions);
    return fail(Error::InvalidArgument);
  }

  ResourceLayout layout;
  layout.resource = std::string(name);
  layout.num_partitions = partitions;
  layout.state_model = std::string(state_model);

  KeyBuilder keys{std::string(cluster)};
  auto r = store_.compare_and_set(keys.ideal_state(name), layout.to_record(),
                                  kAbsentVersion);
  if (!r) {
    if (r.error() == Error::StoreConflict) {
      log::warn("Resource {} already exists in cluster {}", name, cluster);
      return fail(Error::AlreadyExists);
    }
    return r;
  }
  log::debug("Added resource {} ({} partitions, model {})", name, partitions,
             state_model);
  return ok();
}

auto StoreClusterAdmin::drop_resource(std::string_view cluster,
                                      std::string_view name) -> Result<void> {
  KeyBuilder keys{std::string(cluster)};
  if (auto r = store_.remove(keys.ideal_state(name)); !r) {
    log::error("Failed to drop layout of {}: {}", name, r.error().message());
    return r;
  }
  if (auto r = store_.remove(keys.resource_config(name)); !r) {
    log::error("Failed to drop config of {}: {}", name, r.error().message());
    return r;
  }
  log::debug("Dropped resource {}", name);
  return ok();
}

auto StoreClusterAdmin::get_resource_layout(std::string_view cluster,
                                            std::string_view name)
    -> Result<ResourceLayout> {
  KeyBuilder keys{std::string(cluster)};
  auto rec = store_.read(keys.ideal_state(name));
  if (!rec) {
    return fail(rec.error());
  }
  if (!rec->has_value()) {
    return fail(Error::NotFound);
  }
  return ResourceLayout::from_record(**rec);
}

auto StoreClusterAdmin::set_resource_layout(std::string_view cluster,
                                            std::string_view name,
                                            const ResourceLayout& layout)
    -> Result<void> {
  KeyBuilder keys{std::string(cluster)};
  Record rec = layout.to_record();
  rec.id = std::string(name);
  return store_.set(keys.ideal_state(name), rec);
}

}  // namespace jobflow
