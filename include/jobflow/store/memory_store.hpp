#pragma once

#include "jobflow/store/metadata_store.hpp"

#include <map>
#include <mutex>
#include <string>

namespace jobflow {

// Process-local store. Thread-safe; used by tests and single-process tools.
class InMemoryStore final : public MetadataStore {
public:
  InMemoryStore() = default;

  InMemoryStore(const InMemoryStore&) = delete;
  auto operator=(const InMemoryStore&) -> InMemoryStore& = delete;

  [[nodiscard]] auto get(std::string_view path)
      -> Result<std::optional<VersionedRecord>> override;
  [[nodiscard]] auto set(std::string_view path, const Record& record)
      -> Result<void> override;
  [[nodiscard]] auto compare_and_set(std::string_view path,
                                     const Record& record,
                                     std::int64_t expected_version)
      -> Result<void> override;
  [[nodiscard]] auto remove(std::string_view path) -> Result<void> override;
  [[nodiscard]] auto children(std::string_view path)
      -> Result<std::vector<std::string>> override;

  [[nodiscard]] auto size() const -> std::size_t;

private:
  mutable std::mutex mu_;
  std::map<std::string, VersionedRecord, std::less<>> nodes_;
};

}  // namespace jobflow
