#include "jobflow/store/record.hpp"

#include "jobflow/util/log.hpp"

#include <nlohmann/json.hpp>

#include <charconv>

namespace jobflow {

auto Record::simple(std::string_view key) const -> std::optional<std::string> {
  auto it = simple_fields.find(key);
  if (it == simple_fields.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto Record::set_simple(std::string_view key, std::string value) -> void {
  if (auto it = simple_fields.find(key); it != simple_fields.end()) {
    it->second = std::move(value);
    return;
  }
  simple_fields.emplace(std::string(key), std::move(value));
}

auto Record::erase_simple(std::string_view key) -> void {
  if (auto it = simple_fields.find(key); it != simple_fields.end()) {
    simple_fields.erase(it);
  }
}

auto Record::simple_int(std::string_view key) const
    -> std::optional<std::int64_t> {
  auto it = simple_fields.find(key);
  if (it == simple_fields.end()) {
    return std::nullopt;
  }
  const auto& s = it->second;
  std::int64_t value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc{} || ptr != s.data() + s.size()) {
    return std::nullopt;
  }
  return value;
}

auto Record::set_simple_int(std::string_view key, std::int64_t value) -> void {
  set_simple(key, std::to_string(value));
}

auto Record::simple_bool(std::string_view key) const -> std::optional<bool> {
  auto it = simple_fields.find(key);
  if (it == simple_fields.end()) {
    return std::nullopt;
  }
  if (it->second == "true") {
    return true;
  }
  if (it->second == "false") {
    return false;
  }
  return std::nullopt;
}

auto Record::set_simple_bool(std::string_view key, bool value) -> void {
  set_simple(key, value ? "true" : "false");
}

auto Record::list(std::string_view key) const
    -> const std::vector<std::string>* {
  auto it = list_fields.find(key);
  return it != list_fields.end() ? &it->second : nullptr;
}

auto Record::set_list(std::string_view key, std::vector<std::string> values)
    -> void {
  if (auto it = list_fields.find(key); it != list_fields.end()) {
    it->second = std::move(values);
    return;
  }
  list_fields.emplace(std::string(key), std::move(values));
}

auto Record::map(std::string_view key) const -> const MapField* {
  auto it = map_fields.find(key);
  return it != map_fields.end() ? &it->second : nullptr;
}

auto Record::mutable_map(std::string_view key) -> MapField& {
  auto it = map_fields.find(key);
  if (it == map_fields.end()) {
    it = map_fields.try_emplace(std::string(key)).first;
  }
  return it->second;
}

auto Record::set_map(std::string_view key, MapField values) -> void {
  mutable_map(key) = std::move(values);
}

auto Record::to_json() const -> std::string {
  nlohmann::json j;
  j["id"] = id;

  auto simple = nlohmann::json::object();
  for (const auto& [k, v] : simple_fields) {
    simple[k] = v;
  }
  j["simpleFields"] = std::move(simple);

  auto lists = nlohmann::json::object();
  for (const auto& [k, v] : list_fields) {
    lists[k] = v;
  }
  j["listFields"] = std::move(lists);

  auto maps = nlohmann::json::object();
  for (const auto& [k, fields] : map_fields) {
    auto inner = nlohmann::json::object();
    for (const auto& [fk, fv] : fields) {
      inner[fk] = fv;
    }
    maps[k] = std::move(inner);
  }
  j["mapFields"] = std::move(maps);

  return j.dump();
}

auto Record::from_json(std::string_view text) -> Result<Record> {
  try {
    auto j = nlohmann::json::parse(text);
    Record record;
    record.id = j.value("id", std::string{});

    if (auto it = j.find("simpleFields"); it != j.end()) {
      for (const auto& [k, v] : it->items()) {
        record.simple_fields.emplace(k, v.get<std::string>());
      }
    }
    if (auto it = j.find("listFields"); it != j.end()) {
      for (const auto& [k, v] : it->items()) {
        record.list_fields.emplace(k, v.get<std::vector<std::string>>());
      }
    }
    if (auto it = j.find("mapFields"); it != j.end()) {
      for (const auto& [k, v] : it->items()) {
        MapField fields;
        for (const auto& [fk, fv] : v.items()) {
          fields.emplace(fk, fv.get<std::string>());
        }
        record.map_fields.emplace(k, std::move(fields));
      }
    }
    return ok(std::move(record));
  } catch (const nlohmann::json::exception& e) {
    log::error("Failed to decode record: {}", e.what());
    return fail(Error::ParseError);
  }
}

}  // namespace jobflow
