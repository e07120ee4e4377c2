#include "jobflow/store/memory_store.hpp"

#include "jobflow/store/path.hpp"

#include <set>

namespace jobflow {

auto InMemoryStore::get(std::string_view p)
    -> Result<std::optional<VersionedRecord>> {
  std::lock_guard lock(mu_);
  auto it = nodes_.find(path::normalize(p));
  if (it == nodes_.end()) {
    return ok(std::optional<VersionedRecord>{});
  }
  return ok(std::optional<VersionedRecord>{it->second});
}

auto InMemoryStore::set(std::string_view p, const Record& record)
    -> Result<void> {
  std::lock_guard lock(mu_);
  auto key = path::normalize(p);
  auto it = nodes_.find(key);
  if (it == nodes_.end()) {
    nodes_.emplace(std::move(key), VersionedRecord{record, 0});
  } else {
    it->second.record = record;
    ++it->second.version;
  }
  return ok();
}

auto InMemoryStore::compare_and_set(std::string_view p, const Record& record,
                                    std::int64_t expected_version)
    -> Result<void> {
  std::lock_guard lock(mu_);
  auto key = path::normalize(p);
  auto it = nodes_.find(key);
  if (it == nodes_.end()) {
    if (expected_version != kAbsentVersion) {
      return fail(Error::StoreConflict);
    }
    nodes_.emplace(std::move(key), VersionedRecord{record, 0});
    return ok();
  }
  if (it->second.version != expected_version) {
    return fail(Error::StoreConflict);
  }
  it->second.record = record;
  ++it->second.version;
  return ok();
}

auto InMemoryStore::remove(std::string_view p) -> Result<void> {
  std::lock_guard lock(mu_);
  auto key = path::normalize(p);
  nodes_.erase(key);

  auto prefix = path::child_prefix(key);
  auto first = nodes_.lower_bound(prefix);
  auto last = first;
  while (last != nodes_.end() && last->first.starts_with(prefix)) {
    ++last;
  }
  nodes_.erase(first, last);
  return ok();
}

auto InMemoryStore::children(std::string_view p)
    -> Result<std::vector<std::string>> {
  std::lock_guard lock(mu_);
  auto prefix = path::child_prefix(p);

  std::set<std::string, std::less<>> names;
  for (auto it = nodes_.lower_bound(prefix);
       it != nodes_.end() && it->first.starts_with(prefix); ++it) {
    auto name = path::first_segment(it->first, prefix);
    if (!name.empty()) {
      names.emplace(name);
    }
  }
  return ok(std::vector<std::string>(names.begin(), names.end()));
}

auto InMemoryStore::size() const -> std::size_t {
  std::lock_guard lock(mu_);
  return nodes_.size();
}

}  // namespace jobflow
