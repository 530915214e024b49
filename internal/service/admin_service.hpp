#pragma once

#include <cstdint>
#include <string>

#include "gate/v1/submission.pb.h"
#include "service_context.hpp"

namespace gate::service {

// Operator writes: miner registration and task publication.
class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  // Throws util::InvalidArgument for a key that is not 32 bytes of hex.
  void RegisterMiner(int64_t miner_id, const std::string& public_key_hex);

  // created_at is taken from the wall clock, so the newest call wins GET /get_task.
  void AddTask(const gate::v1::TaskInfo& task);

private:
  ServiceContext ctx_;
};

}
