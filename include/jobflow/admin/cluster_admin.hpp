#pragma once

#include "jobflow/admin/resource_layout.hpp"
#include "jobflow/core/error.hpp"
#include "jobflow/store/metadata_store.hpp"

#include <string_view>

namespace jobflow {

// Creates and removes schedulable resources of a cluster.
class ClusterAdmin {
public:
  virtual ~ClusterAdmin() = default;

  // Error::AlreadyExists when the resource is already laid out.
  [[nodiscard]] virtual auto add_resource(std::string_view cluster,
                                          std::string_view name,
                                          int partitions,
                                          std::string_view state_model)
      -> Result<void> = 0;

  // Removes the layout and the resource config. Missing resources are fine.
  [[nodiscard]] virtual auto drop_resource(std::string_view cluster,
                                           std::string_view name)
      -> Result<void> = 0;

  [[nodiscard]] virtual auto get_resource_layout(std::string_view cluster,
                                                 std::string_view name)
      -> Result<ResourceLayout> = 0;

  [[nodiscard]] virtual auto set_resource_layout(std::string_view cluster,
                                                 std::string_view name,
                                                 const ResourceLayout& layout)
      -> Result<void> = 0;
};

class StoreClusterAdmin final : public ClusterAdmin {
public:
  explicit StoreClusterAdmin(MetadataStore& store) : store_(store) {
  }

  [[nodiscard]] auto add_resource(std::string_view cluster,
                                  std::string_view name, int partitions,
                                  std::string_view state_model)
      -> Result<void> override;
  [[nodiscard]] auto drop_resource(std::string_view cluster,
                                   std::string_view name)
      -> Result<void> override;
  [[nodiscard]] auto get_resource_layout(std::string_view cluster,
                                         std::string_view name)
      -> Result<ResourceLayout> override;
  [[nodiscard]] auto set_resource_layout(std::string_view cluster,
                                         std::string_view name,
                                         const ResourceLayout& layout)
      -> Result<void> override;

private:
  MetadataStore& store_;
};

}  // namespace jobflow
