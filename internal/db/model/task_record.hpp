#pragma once

#include <cstdint>
#include <string>

namespace gate::db::model {

struct TaskRecord {
  std::string task_id;
  double      performance_threshold = 0.0;
  std::string validation_data_hash;

  // epoch ms; the newest task is the one served to miners
  uint64_t created_at_ms = 0;
};

} // namespace gate::db::model
