#pragma once

#include "jobflow/core/error.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jobflow {

// Unit of storage at a store path: simple, list and map fields keyed by name.
struct Record {
  using SimpleFields = std::map<std::string, std::string, std::less<>>;
  using ListFields = std::map<std::string, std::vector<std::string>, std::less<>>;
  using MapField = std::map<std::string, std::string, std::less<>>;
  using MapFields = std::map<std::string, MapField, std::less<>>;

  std::string id;
  SimpleFields simple_fields;
  ListFields list_fields;
  MapFields map_fields;

  Record() = default;
  explicit Record(std::string record_id) : id(std::move(record_id)) {
  }

  [[nodiscard]] auto simple(std::string_view key) const
      -> std::optional<std::string>;
  auto set_simple(std::string_view key, std::string value) -> void;
  auto erase_simple(std::string_view key) -> void;

  [[nodiscard]] auto simple_int(std::string_view key) const
      -> std::optional<std::int64_t>;
  auto set_simple_int(std::string_view key, std::int64_t value) -> void;

  [[nodiscard]] auto simple_bool(std::string_view key) const
      -> std::optional<bool>;
  auto set_simple_bool(std::string_view key, bool value) -> void;

  [[nodiscard]] auto list(std::string_view key) const
      -> const std::vector<std::string>*;
  auto set_list(std::string_view key, std::vector<std::string> values) -> void;

  [[nodiscard]] auto map(std::string_view key) const -> const MapField*;
  // Creates an empty map field when missing.
  [[nodiscard]] auto mutable_map(std::string_view key) -> MapField&;
  auto set_map(std::string_view key, MapField values) -> void;

  [[nodiscard]] auto to_json() const -> std::string;
  [[nodiscard]] static auto from_json(std::string_view text) -> Result<Record>;

  [[nodiscard]] friend auto operator==(const Record&, const Record&)
      -> bool = default;
};

}  // namespace jobflow
