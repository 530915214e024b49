#include "internal/core/payload_codec.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

namespace gate::core {

namespace {

using json = nlohmann::json;

const json* Member(const json& object, const char* key) {
  auto it = object.find(key);
  return it == object.end() ? nullptr : &*it;
}

} // namespace

std::optional<gate::v1::SubmissionPayload> ParsePayload(std::string_view text) {
  // malformed text yields a discarded value instead of throwing
  json doc = json::parse(text.begin(), text.end(), nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    return std::nullopt;
  }

  const json* task_id         = Member(doc, "task_id");
  const json* miner_id        = Member(doc, "miner_id");
  const json* performance     = Member(doc, "performance");
  const json* artifact_hash   = Member(doc, "artifact_hash");
  const json* hyperparameters = Member(doc, "hyperparameters");
  const json* timestamp       = Member(doc, "timestamp");
  const json* nonce           = Member(doc, "nonce");
  if (!task_id || !miner_id || !performance || !artifact_hash || !hyperparameters || !timestamp || !nonce) {
    return std::nullopt;
  }

  if (!task_id->is_string() || !artifact_hash->is_string()) return std::nullopt;
  if (!miner_id->is_number_integer()) return std::nullopt;
  if (miner_id->is_number_unsigned() &&
      miner_id->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    return std::nullopt;
  }
  if (!performance->is_number() || !std::isfinite(performance->get<double>())) return std::nullopt;
  if (!timestamp->is_number_unsigned() || !nonce->is_number_unsigned()) return std::nullopt;

  gate::v1::SubmissionPayload payload;
  payload.set_task_id(task_id->get<std::string>());
  payload.set_miner_id(miner_id->get<int64_t>());
  payload.set_performance(performance->get<double>());
  payload.set_artifact_hash(artifact_hash->get<std::string>());
  payload.set_hyperparameters_json(hyperparameters->dump());
  payload.set_timestamp(timestamp->get<uint64_t>());
  payload.set_nonce(nonce->get<uint64_t>());
  return payload;
}

} // namespace gate::core
