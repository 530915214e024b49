#include "internal/core/decision.hpp"

namespace gate::core {

const char* ReasonCode(RejectReason reason) {
  switch (reason) {
    case RejectReason::kMissingFields:
      return "missing_fields";
    case RejectReason::kInvalidPayloadJson:
      return "invalid_payload_json";
    case RejectReason::kReplay:
      return "replay";
    case RejectReason::kRedisError:
      return "redis_error";
    case RejectReason::kStaleTimestamp:
      return "stale_timestamp";
    case RejectReason::kArtifactHashMismatch:
      return "artifact_hash_mismatch";
    case RejectReason::kUnknownMiner:
      return "unknown_miner";
    case RejectReason::kInvalidPubkey:
      return "invalid_pubkey";
    case RejectReason::kBadPubkey:
      return "bad_pubkey";
    case RejectReason::kDbError:
      return "db_error";
    case RejectReason::kSignatureParseError:
      return "signature_parse_error";
    case RejectReason::kBadSignature:
      return "bad_signature";
  }
  return "unknown";
}

} // namespace gate::core
