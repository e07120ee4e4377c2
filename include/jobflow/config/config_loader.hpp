#pragma once

#include "jobflow/config/system_config.hpp"
#include "jobflow/core/error.hpp"
#include "jobflow/store/metadata_store.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace jobflow {

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;

  // Only non-default values are written.
  [[nodiscard]] static auto to_string(const SystemConfig& config)
      -> std::string;
  [[nodiscard]] static auto save_to_file(const SystemConfig& config,
                                         std::string_view path)
      -> Result<void>;
};

// Applies the level and sink of `config` to the process logger.
[[nodiscard]] auto apply_log_config(const LogConfig& config) -> Result<void>;

// Opens the store selected by `config`.
[[nodiscard]] auto make_store(const StoreConfig& config)
    -> Result<std::unique_ptr<MetadataStore>>;

}  // namespace jobflow
