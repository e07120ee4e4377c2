#pragma once

#include "jobflow/core/error.hpp"
#include "jobflow/store/metadata_store.hpp"

#include <functional>
#include <optional>
#include <string_view>

namespace jobflow {

inline constexpr int kDefaultMaxUpdateAttempts = 64;

// Pure transformation of the record at a path.
//   error      -> abort; update_with_retry returns that error unchanged
//   nullopt    -> nothing to write; update_with_retry succeeds
//   record     -> written if the path still holds the version it was read at
// May run several times per call; anything it captures by reference must be
// overwritten on every run, never accumulated.
using RecordUpdater =
    std::function<Result<std::optional<Record>>(std::optional<Record>)>;

// Read, transform, conditionally write; on a concurrent write re-read and
// try again. Fails with Error::StoreConflict once `max_attempts` writes have
// lost the race, leaving the stored record untouched by this call.
[[nodiscard]] auto update_with_retry(MetadataStore& store,
                                     std::string_view path,
                                     const RecordUpdater& updater,
                                     int max_attempts = kDefaultMaxUpdateAttempts)
    -> Result<void>;

}  // namespace jobflow
