#pragma once

#include <cstdint>
#include <string>

namespace gate::db::model {

/*
  Registered miner.

  Managed by the registration process (or gatectl); the gate only reads it.
*/

struct MinerRecord {
  int64_t miner_id = 0;

  // hex text exactly as stored; decoding is the reader's job
  std::string public_key_hex;
};

} // namespace gate::db::model
