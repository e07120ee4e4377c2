#pragma once

#include "jobflow/core/error.hpp"
#include "jobflow/store/record.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jobflow {

// Version a compare_and_set expects when the path must not exist yet.
inline constexpr std::int64_t kAbsentVersion = -1;

struct VersionedRecord {
  Record record;
  std::int64_t version{0};
};

// Hierarchical, strongly consistent key/value store. Paths are '/'-separated;
// a path may have children without holding a record itself.
//
// Implementations must make compare_and_set atomic against every other writer
// of the same backing data, including other processes.
class MetadataStore {
public:
  virtual ~MetadataStore() = default;

  [[nodiscard]] virtual auto get(std::string_view path)
      -> Result<std::optional<VersionedRecord>> = 0;

  // Unconditional write.
  [[nodiscard]] virtual auto set(std::string_view path, const Record& record)
      -> Result<void> = 0;

  // Writes only if the stored version equals `expected_version`
  // (kAbsentVersion: only if nothing is stored). Error::StoreConflict otherwise.
  [[nodiscard]] virtual auto compare_and_set(std::string_view path,
                                             const Record& record,
                                             std::int64_t expected_version)
      -> Result<void> = 0;

  // Removes the record at `path` and everything below it. Missing paths are
  // not an error.
  [[nodiscard]] virtual auto remove(std::string_view path) -> Result<void> = 0;

  // Names (last path segment) of the direct children of `path`, sorted.
  [[nodiscard]] virtual auto children(std::string_view path)
      -> Result<std::vector<std::string>> = 0;

  [[nodiscard]] auto exists(std::string_view path) -> Result<bool> {
    auto r = get(path);
    if (!r) {
      return fail(r.error());
    }
    return ok(r->has_value());
  }

  // Convenience read that drops the version.
  [[nodiscard]] auto read(std::string_view path)
      -> Result<std::optional<Record>> {
    auto r = get(path);
    if (!r) {
      return fail(r.error());
    }
    if (!r->has_value()) {
      return ok(std::optional<Record>{});
    }
    return ok(std::optional<Record>{std::move((*r)->record)});
  }
};

}  // namespace jobflow
