#include "jobflow/store/atomic_update.hpp"

#include "jobflow/util/log.hpp"

namespace jobflow {

auto update_with_retry(MetadataStore& store, std::string_view path,
                       const RecordUpdater& updater, int max_attempts)
    -> Result<void> {
  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    auto current = store.get(path);
    if (!current) {
      return fail(current.error());
    }

    std::int64_t version = kAbsentVersion;
    std::optional<Record> input;
    if (current->has_value()) {
      version = (*current)->version;
      input = std::move((*current)->record);
    }

    auto next = updater(std::move(input));
    if (!next) {
      return fail(next.error());
    }
    if (!next->has_value()) {
      return ok();
    }

    auto written = store.compare_and_set(path, **next, version);
    if (written) {
      return ok();
    }
    if (written.error() != Error::StoreConflict) {
      return fail(written.error());
    }
    log::debug("Concurrent write to {}, retrying (attempt {}/{})", path,
               attempt, max_attempts);
  }

  log::warn("Gave up updating {} after {} conflicting attempts", path,
            max_attempts);
  return fail(Error::StoreConflict);
}

}  // namespace jobflow
