#pragma once

#include "jobflow/core/error.hpp"
#include "jobflow/model/workflow.hpp"

#include <string>
#include <string_view>

namespace jobflow {

// Reads workflow definitions written in YAML:
//
//   name: Nightly
//   terminable: true
//   capacity: 0
//   schedule: {start_time: 0, recurrence_unit: HOURS, recurrence_interval: 24}
//   jobs:
//     - name: extract
//       command: Extract
//       target_resource: db
//       target_partition_states: [MASTER]
//     - name: load
//       command: Load
//       parents: [extract]
//       tasks: [{id: t1, command: Run, config: {x: y}}]
//
// The result is validated before it is returned.
class WorkflowLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<Workflow>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<Workflow>;
  [[nodiscard]] static auto to_string(const Workflow& workflow) -> std::string;
};

}  // namespace jobflow
