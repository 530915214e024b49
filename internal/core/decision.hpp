#pragma once

#include <string>
#include <utility>

namespace gate::core {

enum class RejectReason {
  kMissingFields,
  kInvalidPayloadJson,
  kReplay,
  kRedisError,
  kStaleTimestamp,
  kArtifactHashMismatch,
  kUnknownMiner,
  kInvalidPubkey,
  kBadPubkey,
  kDbError,
  kSignatureParseError,
  kBadSignature,
};

// Wire code returned to clients, e.g. "stale_timestamp".
const char* ReasonCode(RejectReason reason);

struct Decision {
  bool         accepted = false;
  RejectReason reason   = RejectReason::kMissingFields; // meaningful when !accepted
  std::string  record_id;                               // set when accepted

  static Decision Accept(std::string record_id) {
    Decision d;
    d.accepted  = true;
    d.record_id = std::move(record_id);
    return d;
  }

  static Decision Reject(RejectReason reason) {
    Decision d;
    d.reason = reason;
    return d;
  }
};

} // namespace gate::core
